#pragma once
#include <aegis/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace aegis::storage {

using key_value_entry_t =
    std::pair<aegis::schema::bytes_t, aegis::schema::bytes_t>;

/// One staged mutation; an empty value deletes the key.
using write_entry_t =
    std::pair<aegis::schema::bytes_t, std::optional<aegis::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const aegis::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const aegis::schema::bytes_view_t& key,
           const T& value) const;

  /// Return the raw bytes stored at key, or std::nullopt when missing.
  std::optional<aegis::schema::bytes_t> get_raw(
      const aegis::schema::bytes_view_t& key) const;

  /// Apply all puts and deletes as a single atomic batch.
  void write_batch(const std::vector<write_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const aegis::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace aegis::storage
