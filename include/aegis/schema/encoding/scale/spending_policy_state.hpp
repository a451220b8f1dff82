#pragma once
#include <aegis/schema/spending_policy_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(spending_policy_state<1>&& o, ::scale::Encoder& encoder);
void decode(spending_policy_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
