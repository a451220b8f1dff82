#include <aegis/schema/encoding/scale/transfer_call.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(transfer_call<1>&& o, ::scale::Encoder& encoder) {
  encode(o.recipient, encoder);
  encode(o.amount, encoder);
}

void decode(transfer_call<1>&& o, ::scale::Decoder& decoder) {
  decode(o.recipient, decoder);
  decode(o.amount, decoder);
}

}  // namespace aegis::schema::encoding::scale
