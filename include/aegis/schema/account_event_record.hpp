#pragma once

#include <aegis/schema/account_event_type.hpp>
#include <aegis/schema/primitives.hpp>
#include <optional>

namespace aegis::schema {

template <uint16_t Version>
struct account_event_record;

template <>
struct account_event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  account_event_type_t type{};
  account_id_t account_id{};
  uint32_t code{};
  std::optional<hash32_t> subject;
  bytes_t message;
  timestamp_milliseconds_t recorded_at{};
};

using account_event_record_t = account_event_record<1>;

}  // namespace aegis::schema
