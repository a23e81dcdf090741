#pragma once
#include <vellum/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace vellum::storage {

using key_value_entry_t =
    std::pair<vellum::schema::bytes_t, vellum::schema::bytes_t>;

/// One mutation inside an atomic write. A missing value deletes the key.
struct write_entry final {
  vellum::schema::bytes_t key;
  std::optional<vellum::schema::bytes_t> value;
};

template <typename Library>
struct prefix_cursor;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const vellum::schema::bytes_view_t& key) const;

  std::optional<vellum::schema::bytes_t> get_raw(
      const vellum::schema::bytes_view_t& key) const;

  /// Apply every entry or none of them.
  void write(const std::vector<write_entry>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const vellum::schema::bytes_view_t& prefix) const;

  prefix_cursor<Library> scan_prefix(
      const vellum::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Open an existing backend for reads alongside a live writer. Writes through
/// the returned storage fail.
template <typename Library>
storage<Library> make_read_only_storage(const std::string_view& path);

}  // namespace vellum::storage
