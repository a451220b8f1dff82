#include <aegis/schema/encoding/scale/spending_limit_config.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(spending_limit_config<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account_id, encoder);
  encode(o.asset_id, encoder);
  encode(o.limit, encoder);
  encode(o.period_length, encoder);
  encode(o.spent, encoder);
  encode(o.period_start, encoder);
  encode(o.enabled, encoder);
}

void decode(spending_limit_config<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account_id, decoder);
  decode(o.asset_id, decoder);
  decode(o.limit, decoder);
  decode(o.period_length, decoder);
  decode(o.spent, decoder);
  decode(o.period_start, decoder);
  decode(o.enabled, decoder);
}

void encode(spending_limit_rule<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset_id, encoder);
  encode(o.limit, encoder);
  encode(o.period_length, encoder);
}

void decode(spending_limit_rule<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset_id, decoder);
  decode(o.limit, decoder);
  decode(o.period_length, decoder);
}

}  // namespace aegis::schema::encoding::scale
