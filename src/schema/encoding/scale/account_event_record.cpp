#include <aegis/schema/encoding/scale/account_event_record.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(account_event_record<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.type, encoder);
  encode(o.account_id, encoder);
  encode(o.code, encoder);
  encode(o.subject, encoder);
  encode(o.message, encoder);
  encode(o.recorded_at, encoder);
}

void decode(account_event_record<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.type, decoder);
  decode(o.account_id, decoder);
  decode(o.code, decoder);
  decode(o.subject, decoder);
  decode(o.message, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace aegis::schema::encoding::scale
