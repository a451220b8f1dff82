#pragma once

#include <aegis/schema/primitives.hpp>
#include <vector>

// Schema type: guardian config.
// N-of-M guardian set and recovery delay of one account.
namespace aegis::schema {

template <uint16_t Version>
struct guardian_config;

template <>
struct guardian_config<1> final {
  uint16_t version{1};
  account_id_t account_id{};
  std::vector<signer_id_t> guardians;
  uint32_t threshold{};
  duration_milliseconds_t recovery_delay{};
};

using guardian_config_t = guardian_config<1>;

/// Install data of the guardian recovery validator.
template <uint16_t Version>
struct guardian_config_init;

template <>
struct guardian_config_init<1> final {
  uint16_t version{1};
  std::vector<signer_id_t> guardians;
  uint32_t threshold{};
  duration_milliseconds_t recovery_delay{};
};

using guardian_config_init_t = guardian_config_init<1>;

}  // namespace aegis::schema
