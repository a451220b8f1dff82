#pragma once
#include <aegis/schema/operation.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(operation<1>&& o, ::scale::Encoder& encoder);
void decode(operation<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
