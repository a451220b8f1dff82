#include <aegis/schema/encoding/scale/guardian_config.hpp>
#include <aegis/schema/encoding/scale/primitives.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(guardian_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account_id, encoder);
  encode(o.guardians, encoder);
  encode(o.threshold, encoder);
  encode(o.recovery_delay, encoder);
}

void decode(guardian_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account_id, decoder);
  decode(o.guardians, decoder);
  decode(o.threshold, decoder);
  decode(o.recovery_delay, decoder);
}

void encode(guardian_config_init<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.guardians, encoder);
  encode(o.threshold, encoder);
  encode(o.recovery_delay, encoder);
}

void decode(guardian_config_init<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.guardians, decoder);
  decode(o.threshold, decoder);
  decode(o.recovery_delay, decoder);
}

}  // namespace aegis::schema::encoding::scale
