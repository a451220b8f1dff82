#include <aegis/schema/encoding/scale/operation.hpp>
#include <aegis/schema/encoding/scale/primitives.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(operation<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account, encoder);
  encode(o.target, encoder);
  encode(o.value, encoder);
  encode(o.payload, encoder);
  encode(o.validation_id, encoder);
  encode(o.validation_data, encoder);
  encode(o.signer, encoder);
}

void decode(operation<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account, decoder);
  decode(o.target, decoder);
  decode(o.value, decoder);
  decode(o.payload, decoder);
  decode(o.validation_id, decoder);
  decode(o.validation_data, decoder);
  decode(o.signer, decoder);
}

}  // namespace aegis::schema::encoding::scale
