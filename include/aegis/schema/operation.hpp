#pragma once

#include <aegis/schema/primitives.hpp>

// Schema type: operation.
// Descriptor of one call an account makes: target, attached value, payload
// and the validator it intends to satisfy.
namespace aegis::schema {

template <uint16_t Version>
struct operation;

template <>
struct operation<1> final {
  uint16_t version{1};
  account_id_t account{};
  hash32_t target{};
  amount_t value{};
  bytes_t payload;
  // Zero selects the root validator.
  module_id_t validation_id{};
  bytes_t validation_data;
  // Identity claiming authority for entry point submissions.
  signer_id_t signer;
};

using operation_t = operation<1>;

/// First four payload bytes; zero for payloads shorter than a selector.
inline selector_t selector_of(const operation_t& op) {
  auto selector = selector_t{};
  if (op.payload.size() >= selector.size()) {
    for (std::size_t i = 0; i < selector.size(); ++i) {
      selector[i] = op.payload[i];
    }
  }
  return selector;
}

}  // namespace aegis::schema
