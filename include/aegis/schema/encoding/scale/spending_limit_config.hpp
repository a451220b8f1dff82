#pragma once
#include <aegis/schema/spending_limit_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(spending_limit_config<1>&& o, ::scale::Encoder& encoder);
void decode(spending_limit_config<1>&& o, ::scale::Decoder& decoder);

void encode(spending_limit_rule<1>&& o, ::scale::Encoder& encoder);
void decode(spending_limit_rule<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
