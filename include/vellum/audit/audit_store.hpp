#pragma once

#include <vellum/schema/audit_entry.hpp>
#include <vellum/schema/encoding/scale/encoder.hpp>
#include <vellum/schema/event_type.hpp>
#include <vellum/schema/lifecycle_state.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::audit {

using encoder_t = vellum::schema::encoding::encoder<
    vellum::schema::encoding::scale_encoder_tag>;
using storage_t =
    vellum::storage::storage<vellum::storage::rocksdb_storage_tag>;

/// A stored row; `entry` is empty when its bytes no longer decode.
struct stored_entry final {
  vellum::schema::entry_id_t id{};
  std::optional<vellum::schema::audit_entry_t> entry;
};

/// Lazy, id-ascending walk over one tenant's entries as they were when the
/// cursor was opened. Single pass.
class entry_cursor final {
 public:
  std::optional<vellum::schema::audit_entry_t> next();
  std::optional<stored_entry> try_next();

 private:
  friend class audit_store;
  entry_cursor(
      vellum::storage::prefix_cursor<vellum::storage::rocksdb_storage_tag>&&
          cursor,
      encoder_t& encoder);

  vellum::storage::prefix_cursor<vellum::storage::rocksdb_storage_tag> cursor_;
  encoder_t& encoder_;
};

struct lifecycle_change final {
  vellum::schema::lifecycle_state_t state{};
  /// Allocate a sequence_reference when the entry does not have one yet.
  bool assign_reference{false};
};

/// Append-only persistence of audit entries, partitioned by tenant.
/// overwrite/erase are reachable only through immutability_guard.
class audit_store final {
 public:
  audit_store(storage_t& storage, encoder_t& encoder);

  static audit_store with_maintenance_mode(storage_t& storage,
                                           encoder_t& encoder);

  bool maintenance_mode() const noexcept { return maintenance_mode_; }

  /// Throws conflict_error when previous_hash no longer names the tenant's
  /// last entry.
  vellum::schema::audit_entry_t append(vellum::schema::audit_entry_t entry);

  std::optional<vellum::schema::audit_entry_t> last_for_tenant(
      std::string_view tenant_id) const;

  std::optional<vellum::schema::audit_entry_t> get(
      vellum::schema::entry_id_t id) const;

  entry_cursor cursor_for_tenant(std::string_view tenant_id) const;
  std::vector<vellum::schema::audit_entry_t> list_for_tenant(
      std::string_view tenant_id) const;

  std::vector<std::string> list_tenants() const;

  /// `decide` sees the stored entry and returns the change or throws.
  vellum::schema::audit_entry_t apply_transition(
      vellum::schema::entry_id_t id,
      const std::function<lifecycle_change(
          const vellum::schema::audit_entry_t&)>& decide);

 private:
  friend class immutability_guard;

  audit_store(storage_t& storage, encoder_t& encoder, bool maintenance_mode);

  void overwrite(const vellum::schema::audit_entry_t& entry);

  /// Drop the entry and its id index. Ids are never handed out again.
  void erase(const vellum::schema::audit_entry_t& entry);

  std::optional<vellum::schema::audit_entry_t> load_last(
      const vellum::schema::hash32_t& tenant_digest) const;
  std::optional<vellum::schema::hash32_t> load_tenant_digest(
      vellum::schema::entry_id_t id) const;
  uint64_t load_counter(const vellum::schema::bytes_t& key) const;

  storage_t& storage_;
  encoder_t& encoder_;
  bool maintenance_mode_{false};
  mutable std::mutex mutex_;
};

}  // namespace vellum::audit
