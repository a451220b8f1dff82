#include <aegis/schema/encoding/scale/account_state.hpp>
#include <aegis/schema/encoding/scale/installed_module.hpp>
#include <aegis/schema/encoding/scale/primitives.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(account_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account_id, encoder);
  encode(o.root_authority, encoder);
  encode(o.emergency_identity, encoder);
  encode(o.salt, encoder);
  encode(o.created_at, encoder);
  encode(o.last_activity_at, encoder);
  encode(o.installed_modules, encoder);
}

void decode(account_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account_id, decoder);
  decode(o.root_authority, decoder);
  decode(o.emergency_identity, decoder);
  decode(o.salt, decoder);
  decode(o.created_at, decoder);
  decode(o.last_activity_at, decoder);
  decode(o.installed_modules, decoder);
}

}  // namespace aegis::schema::encoding::scale
