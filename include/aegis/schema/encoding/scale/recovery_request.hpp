#pragma once
#include <aegis/schema/recovery_request.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(recovery_request<1>&& o, ::scale::Encoder& encoder);
void decode(recovery_request<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
