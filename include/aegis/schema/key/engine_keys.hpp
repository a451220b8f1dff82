#pragma once

#include <aegis/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <utility>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for account, delegation, recovery,
// spending and event state.
namespace aegis::schema::key {

inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kDelegationKeyPrefix{
    "SYS|STATE|DELEGATION|"};
inline constexpr std::string_view kDelegatorIndexKeyPrefix{
    "SYS|STATE|DELEGATOR_INDEX|"};
inline constexpr std::string_view kDelegationSeqKeyPrefix{
    "SYS|STATE|DELEGATION_SEQ|"};
inline constexpr std::string_view kDelegationNonceKeyPrefix{
    "SYS|STATE|DELEGATION_NONCE|"};
inline constexpr std::string_view kGuardianConfigKeyPrefix{
    "SYS|STATE|GUARDIAN_CONFIG|"};
inline constexpr std::string_view kRecoveryRequestKeyPrefix{
    "SYS|STATE|RECOVERY_REQUEST|"};
inline constexpr std::string_view kSpendingLimitKeyPrefix{
    "SYS|STATE|SPENDING_LIMIT|"};
inline constexpr std::string_view kSpendingPolicyKeyPrefix{
    "SYS|STATE|SPENDING_POLICY|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 11> kEngineKeyspaces{
    kAccountKeyPrefix,
    kDelegationKeyPrefix,
    kDelegatorIndexKeyPrefix,
    kDelegationSeqKeyPrefix,
    kDelegationNonceKeyPrefix,
    kGuardianConfigKeyPrefix,
    kRecoveryRequestKeyPrefix,
    kSpendingLimitKeyPrefix,
    kSpendingPolicyKeyPrefix,
    kEventSeqKeyPrefix,
    kEventPrefix};

template <typename Encoder, typename T>
aegis::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
aegis::schema::bytes_t make_account_key(
    Encoder& encoder,
    const aegis::schema::account_id_t& account_id) {
  return make_prefixed_key(encoder, kAccountKeyPrefix, account_id);
}

template <typename Encoder>
aegis::schema::bytes_t make_delegation_key(
    Encoder& encoder,
    const aegis::schema::delegation_id_t& delegation_id) {
  return make_prefixed_key(encoder, kDelegationKeyPrefix, delegation_id);
}

template <typename Encoder>
aegis::schema::bytes_t make_delegator_index_key(
    Encoder& encoder,
    const aegis::schema::account_id_t& delegator) {
  return make_prefixed_key(encoder, kDelegatorIndexKeyPrefix, delegator);
}

template <typename Encoder>
aegis::schema::bytes_t make_delegation_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kDelegationSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
aegis::schema::bytes_t make_delegation_nonce_key(
    Encoder& encoder,
    const aegis::schema::account_id_t& delegator) {
  return make_prefixed_key(encoder, kDelegationNonceKeyPrefix, delegator);
}

template <typename Encoder>
aegis::schema::bytes_t make_guardian_config_key(
    Encoder& encoder,
    const aegis::schema::account_id_t& account_id) {
  return make_prefixed_key(encoder, kGuardianConfigKeyPrefix, account_id);
}

template <typename Encoder>
aegis::schema::bytes_t make_recovery_request_key(
    Encoder& encoder,
    const aegis::schema::account_id_t& account_id) {
  return make_prefixed_key(encoder, kRecoveryRequestKeyPrefix, account_id);
}

template <typename Encoder>
aegis::schema::bytes_t make_spending_limit_key(
    Encoder& encoder,
    const aegis::schema::account_id_t& account_id,
    const aegis::schema::asset_id_t& asset_id) {
  return make_prefixed_key(encoder, kSpendingLimitKeyPrefix,
                           std::tuple{account_id, asset_id});
}

template <typename Encoder>
aegis::schema::bytes_t make_spending_policy_key(
    Encoder& encoder,
    const aegis::schema::account_id_t& account_id) {
  return make_prefixed_key(encoder, kSpendingPolicyKeyPrefix, account_id);
}

template <typename Encoder>
aegis::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
aegis::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

template <typename Encoder>
aegis::schema::bytes_t make_keyspace_prefix(Encoder& encoder,
                                            std::string_view prefix) {
  return encoder.encode(prefix);
}

}  // namespace aegis::schema::key
