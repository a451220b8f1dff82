#pragma once
#include <aegis/schema/transfer_call.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(transfer_call<1>&& o, ::scale::Encoder& encoder);
void decode(transfer_call<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
