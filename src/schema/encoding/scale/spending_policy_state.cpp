#include <aegis/schema/encoding/scale/primitives.hpp>
#include <aegis/schema/encoding/scale/spending_policy_state.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(spending_policy_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account_id, encoder);
  encode(o.paused, encoder);
  encode(o.whitelist, encoder);
  encode(o.limited_assets, encoder);
}

void decode(spending_policy_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account_id, decoder);
  decode(o.paused, decoder);
  decode(o.whitelist, decoder);
  decode(o.limited_assets, decoder);
}

}  // namespace aegis::schema::encoding::scale
