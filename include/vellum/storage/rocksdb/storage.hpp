#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <vellum/common/critical.hpp>
#include <vellum/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace vellum::storage {

namespace detail {

inline vellum::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const vellum::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// Iterator pinned to a RocksDB snapshot. Writes made after the cursor was
/// opened are invisible to it. The snapshot is released on destruction.
template <>
struct prefix_cursor<rocksdb_storage_tag> final {
  prefix_cursor(ROCKSDB_NAMESPACE::DB* database,
                const vellum::schema::bytes_view_t& prefix);
  prefix_cursor(const prefix_cursor&) = delete;
  prefix_cursor& operator=(const prefix_cursor&) = delete;
  prefix_cursor(prefix_cursor&& other) noexcept;
  prefix_cursor& operator=(prefix_cursor&&) = delete;
  ~prefix_cursor();

  std::optional<key_value_entry_t> next();

 private:
  ROCKSDB_NAMESPACE::DB* database_{nullptr};
  const ROCKSDB_NAMESPACE::Snapshot* snapshot_{nullptr};
  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator_;
  std::string prefix_;
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const vellum::schema::bytes_view_t& key) const;

  std::optional<vellum::schema::bytes_t> get_raw(
      const vellum::schema::bytes_view_t& key) const;
  void write(const std::vector<write_entry>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const vellum::schema::bytes_view_t& prefix) const;
  prefix_cursor<rocksdb_storage_tag> scan_prefix(
      const vellum::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
storage<rocksdb_storage_tag> make_read_only_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const vellum::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(vellum::schema::make_bytes_view(*value))};
}

}  // namespace vellum::storage
