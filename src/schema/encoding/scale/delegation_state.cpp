#include <aegis/schema/encoding/scale/delegation_state.hpp>
#include <aegis/schema/encoding/scale/primitives.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(delegation_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.delegation_id, encoder);
  encode(o.delegator, encoder);
  encode(o.delegatee, encoder);
  encode(o.type, encoder);
  encode(o.status, encoder);
  encode(o.start_time, encoder);
  encode(o.end_time, encoder);
  encode(o.spending_limit, encoder);
  encode(o.spent_amount, encoder);
  encode(o.allowed_selectors, encoder);
}

void decode(delegation_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.delegation_id, decoder);
  decode(o.delegator, decoder);
  decode(o.delegatee, decoder);
  decode(o.type, decoder);
  decode(o.status, decoder);
  decode(o.start_time, decoder);
  decode(o.end_time, decoder);
  decode(o.spending_limit, decoder);
  decode(o.spent_amount, decoder);
  decode(o.allowed_selectors, decoder);
}

}  // namespace aegis::schema::encoding::scale
