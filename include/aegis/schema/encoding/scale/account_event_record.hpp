#pragma once
#include <aegis/schema/account_event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace aegis::schema::encoding::scale {

void encode(account_event_record<1>&& o, ::scale::Encoder& encoder);
void decode(account_event_record<1>&& o, ::scale::Decoder& decoder);

}  // namespace aegis::schema::encoding::scale
