#include <aegis/schema/encoding/scale/delegation_params.hpp>
#include <aegis/schema/encoding/scale/primitives.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(delegation_params<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.delegatee, encoder);
  encode(o.type, encoder);
  encode(o.duration, encoder);
  encode(o.spending_limit, encoder);
  encode(o.allowed_selectors, encoder);
}

void decode(delegation_params<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.delegatee, decoder);
  decode(o.type, decoder);
  decode(o.duration, decoder);
  decode(o.spending_limit, decoder);
  decode(o.allowed_selectors, decoder);
}

}  // namespace aegis::schema::encoding::scale
