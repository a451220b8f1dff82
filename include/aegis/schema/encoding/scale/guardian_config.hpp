#pragma once
#include <aegis/schema/guardian_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(guardian_config<1>&& o, ::scale::Encoder& encoder);
void decode(guardian_config<1>&& o, ::scale::Decoder& decoder);

void encode(guardian_config_init<1>&& o, ::scale::Encoder& encoder);
void decode(guardian_config_init<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
