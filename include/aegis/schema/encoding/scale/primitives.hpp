#pragma once
#include <aegis/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(ed25519_signer_id&& o, ::scale::Encoder& encoder);
void decode(ed25519_signer_id&& o, ::scale::Decoder& decoder);

void encode(secp256k1_signer_id&& o, ::scale::Encoder& encoder);
void decode(secp256k1_signer_id&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
