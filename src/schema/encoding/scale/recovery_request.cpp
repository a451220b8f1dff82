#include <aegis/schema/encoding/scale/primitives.hpp>
#include <aegis/schema/encoding/scale/recovery_request.hpp>

using namespace aegis::schema;

namespace aegis::schema::encoding::scale {

void encode(recovery_request<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.account_id, encoder);
  encode(o.new_root_authority, encoder);
  encode(o.initiated_by, encoder);
  encode(o.initiated_at, encoder);
  encode(o.approval_count, encoder);
  encode(o.approvals, encoder);
}

void decode(recovery_request<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.account_id, decoder);
  decode(o.new_root_authority, decoder);
  decode(o.initiated_by, decoder);
  decode(o.initiated_at, decoder);
  decode(o.approval_count, decoder);
  decode(o.approvals, decoder);
}

}  // namespace aegis::schema::encoding::scale
