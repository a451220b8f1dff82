#pragma once
#include <aegis/common/critical.hpp>
#include <aegis/schema/encoding/encoder.hpp>
#include <aegis/schema/encoding/scale/account_event_record.hpp>
#include <aegis/schema/encoding/scale/account_state.hpp>
#include <aegis/schema/encoding/scale/delegation_params.hpp>
#include <aegis/schema/encoding/scale/delegation_state.hpp>
#include <aegis/schema/encoding/scale/guardian_config.hpp>
#include <aegis/schema/encoding/scale/installed_module.hpp>
#include <aegis/schema/encoding/scale/operation.hpp>
#include <aegis/schema/encoding/scale/primitives.hpp>
#include <aegis/schema/encoding/scale/query_result.hpp>
#include <aegis/schema/encoding/scale/recovery_request.hpp>
#include <aegis/schema/encoding/scale/spending_limit_config.hpp>
#include <aegis/schema/encoding/scale/spending_policy_state.hpp>
#include <aegis/schema/encoding/scale/transfer_call.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace aegis::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  aegis::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, aegis::schema::bytes_t& out);

  template <typename T>
  T decode(const aegis::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const aegis::schema::bytes_view_t& bytes);
};

template <typename T>
aegis::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    aegis::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        aegis::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const aegis::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    aegis::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const aegis::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace aegis::schema::encoding
