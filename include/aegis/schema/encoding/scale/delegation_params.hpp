#pragma once
#include <aegis/schema/delegation_params.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(delegation_params<1>&& o, ::scale::Encoder& encoder);
void decode(delegation_params<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
