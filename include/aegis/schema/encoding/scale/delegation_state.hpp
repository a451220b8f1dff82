#pragma once
#include <aegis/schema/delegation_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(delegation_state<1>&& o, ::scale::Encoder& encoder);
void decode(delegation_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
