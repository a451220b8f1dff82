#pragma once

#include <aegis/schema/error_code.hpp>
#include <aegis/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace aegis::execution {

/// Detail of a quota rejection: the asset, the requested amount and what was
/// still available in the current period.
struct spending_violation_t final {
  aegis::schema::asset_id_t asset{};
  aegis::schema::amount_t amount{};
  aegis::schema::amount_t remaining{};
};

/// Outcome of an engine operation. Errors are values; `value` is set only on
/// success.
template <typename T>
struct result final {
  aegis::schema::error_code_t code{aegis::schema::error_code_t::ok};
  std::string log;
  std::string codespace;
  std::optional<T> value;
  std::optional<spending_violation_t> violation;

  bool ok() const { return code == aegis::schema::error_code_t::ok; }
};

using status_t = result<std::monostate>;

template <typename T>
result<T> make_ok(T value) {
  auto out = result<T>{};
  out.value = std::move(value);
  return out;
}

inline status_t make_ok() {
  return make_ok(std::monostate{});
}

template <typename T = std::monostate>
result<T> make_error(const aegis::schema::error_code_t code,
                     const std::string_view codespace,
                     std::string log) {
  auto out = result<T>{};
  out.code = code;
  out.codespace = std::string{codespace};
  out.log = std::move(log);
  return out;
}

/// Carry the rejection of `other` into a result of another value type.
template <typename T, typename U>
result<T> forward_error(const result<U>& other) {
  auto out = result<T>{};
  out.code = other.code;
  out.log = other.log;
  out.codespace = other.codespace;
  out.violation = other.violation;
  return out;
}

}  // namespace aegis::execution
