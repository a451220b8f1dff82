#pragma once
#include <aegis/schema/account_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(account_state<1>&& o, ::scale::Encoder& encoder);
void decode(account_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
