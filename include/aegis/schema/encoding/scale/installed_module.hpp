#pragma once
#include <aegis/schema/installed_module.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(installed_module_t&& o, ::scale::Encoder& encoder);
void decode(installed_module_t&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
