#pragma once

#include <aegis/schema/operation.hpp>
#include <aegis/schema/primitives.hpp>
#include <iterator>
#include <optional>

// Schema type: transfer call.
// Payload of a token transfer: the selector followed by the SCALE encoded
// recipient and amount. The token is the operation's target.
namespace aegis::schema {

inline constexpr auto kTransferSelector = selector_t{0xa9, 0x05, 0x9c, 0xbb};

template <uint16_t Version>
struct transfer_call;

template <>
struct transfer_call<1> final {
  hash32_t recipient{};
  amount_t amount{};
};

using transfer_call_t = transfer_call<1>;

template <typename Encoder>
bytes_t make_transfer_payload(Encoder& encoder, const transfer_call_t& call) {
  auto payload = bytes_t{std::begin(kTransferSelector),
                         std::end(kTransferSelector)};
  encoder.encode(call, payload);
  return payload;
}

/// Decode a transfer payload; std::nullopt for any other payload.
template <typename Encoder>
std::optional<transfer_call_t> try_parse_transfer(Encoder& encoder,
                                                  const operation_t& op) {
  if (selector_of(op) != kTransferSelector) {
    return std::nullopt;
  }
  return encoder.template try_decode<transfer_call_t>(bytes_view_t{
      op.payload.data() + kTransferSelector.size(),
      op.payload.size() - kTransferSelector.size()});
}

}  // namespace aegis::schema
