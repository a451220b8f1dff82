#include <aegis/schema/encoding/scale/primitives.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(ed25519_signer_id&& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id&& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

void encode(secp256k1_signer_id&& o, ::scale::Encoder& encoder) {
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id&& o, ::scale::Decoder& decoder) {
  decode(o.public_key, decoder);
}

}  // namespace aegis::schema::encoding::scale
