#pragma once

#include <aegis/schema/primitives.hpp>
#include <vector>

// Schema type: recovery request.
// The single outstanding guardian proposal to replace an account's root
// authority.
namespace aegis::schema {

template <uint16_t Version>
struct recovery_request;

template <>
struct recovery_request<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  signer_id_t new_root_authority;
  signer_id_t initiated_by;
  timestamp_milliseconds_t initiated_at{};
  uint32_t approval_count{};
  std::vector<signer_id_t> approvals;
};

using recovery_request_t = recovery_request<1>;

}  // namespace aegis::schema
