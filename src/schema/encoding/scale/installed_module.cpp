#include <aegis/schema/encoding/scale/installed_module.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(installed_module_t&& o, ::scale::Encoder& encoder) {
  encode(o.type, encoder);
  encode(o.module_id, encoder);
}

void decode(installed_module_t&& o, ::scale::Decoder& decoder) {
  decode(o.type, decoder);
  decode(o.module_id, decoder);
}

}  // namespace aegis::schema::encoding::scale
