#include <vellum/common/critical.hpp>
#include <vellum/storage/rocksdb/storage.hpp>

namespace vellum::storage {

prefix_cursor<rocksdb_storage_tag>::prefix_cursor(
    ROCKSDB_NAMESPACE::DB* database,
    const vellum::schema::bytes_view_t& prefix)
    : database_{database},
      prefix_{vellum::schema::make_string(prefix)} {
  if (!database_) {
    vellum::common::critical("RocksDB database is not initialized");
  }
  snapshot_ = database_->GetSnapshot();
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = snapshot_;
  iterator_.reset(database_->NewIterator(read_options));
  iterator_->Seek(prefix_);
}

prefix_cursor<rocksdb_storage_tag>::prefix_cursor(
    prefix_cursor&& other) noexcept
    : database_{other.database_},
      snapshot_{other.snapshot_},
      iterator_{std::move(other.iterator_)},
      prefix_{std::move(other.prefix_)} {
  other.database_ = nullptr;
  other.snapshot_ = nullptr;
}

prefix_cursor<rocksdb_storage_tag>::~prefix_cursor() {
  // The iterator pins the snapshot and must go first.
  iterator_.reset();
  if (database_ && snapshot_) {
    database_->ReleaseSnapshot(snapshot_);
  }
}

std::optional<key_value_entry_t> prefix_cursor<rocksdb_storage_tag>::next() {
  if (!iterator_ || !iterator_->Valid()) {
    return std::nullopt;
  }
  auto key_view =
      std::string_view{iterator_->key().data(), iterator_->key().size()};
  if (!key_view.starts_with(prefix_)) {
    return std::nullopt;
  }
  auto entry = key_value_entry_t{detail::to_bytes(iterator_->key()),
                                 detail::to_bytes(iterator_->value())};
  iterator_->Next();
  if (!iterator_->status().ok()) {
    spdlog::error("RocksDB iterator failed: {}",
                  iterator_->status().ToString());
    vellum::common::critical("RocksDB iterator failed");
  }
  return entry;
}

std::optional<vellum::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const vellum::schema::bytes_view_t& key) const {
  if (!database) {
    vellum::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    vellum::common::critical("Failed to get value from RocksDB");
  }
  return vellum::schema::bytes_t(std::begin(value), std::end(value));
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<write_entry>& entries) const {
  if (!database) {
    vellum::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice = detail::to_slice(vellum::schema::make_bytes_view(key));
    auto status =
        value ? batch.Put(key_slice, detail::to_slice(
                                         vellum::schema::make_bytes_view(*value)))
              : batch.Delete(key_slice);
    if (!status.ok()) {
      spdlog::error("Failed to stage RocksDB write: {}", status.ToString());
      vellum::common::critical("Failed to stage RocksDB write");
    }
  }
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    vellum::common::critical("Failed to commit RocksDB batch");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const vellum::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto cursor = scan_prefix(prefix);
  while (auto entry = cursor.next()) {
    entries.push_back(std::move(*entry));
  }
  return entries;
}

prefix_cursor<rocksdb_storage_tag> storage<rocksdb_storage_tag>::scan_prefix(
    const vellum::schema::bytes_view_t& prefix) const {
  return prefix_cursor<rocksdb_storage_tag>{database.get(), prefix};
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    vellum::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened audit store at {}", path);
  store.database.reset(database);

  return store;
}

template <>
storage<rocksdb_storage_tag> make_read_only_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  // No LOCK file is taken, so a running server keeps the database.
  auto options = ROCKSDB_NAMESPACE::Options{};
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::OpenForReadOnly(
      options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB read-only at {}: {}", path,
                  status.ToString());
    vellum::common::critical("Failed to open RocksDB read-only");
  }
  spdlog::info("Opened audit store read-only at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace vellum::storage
