#include <spdlog/spdlog.h>
#include <vellum/audit/audit_store.hpp>
#include <vellum/chain/hash_chainer.hpp>
#include <vellum/common/critical.hpp>
#include <vellum/common/error.hpp>
#include <vellum/schema/key/audit_keys.hpp>
#include <vellum/schema/sequence_reference.hpp>

#include <algorithm>
#include <utility>

using namespace vellum::schema;
namespace keys = vellum::schema::key;

namespace vellum::audit {

namespace {

bytes_t digest_bytes(const hash32_t& digest) {
  return bytes_t{std::begin(digest), std::end(digest)};
}

}  // namespace

entry_cursor::entry_cursor(
    vellum::storage::prefix_cursor<vellum::storage::rocksdb_storage_tag>&&
        cursor,
    encoder_t& encoder)
    : cursor_{std::move(cursor)}, encoder_{encoder} {}

std::optional<audit_entry_t> entry_cursor::next() {
  auto row = cursor_.next();
  if (!row) {
    return std::nullopt;
  }
  return encoder_.decode<audit_entry_t>(make_bytes_view(row->second));
}

std::optional<stored_entry> entry_cursor::try_next() {
  auto row = cursor_.next();
  if (!row) {
    return std::nullopt;
  }
  auto id = keys::parse_entry_id(make_bytes_view(row->first));
  if (!id) {
    vellum::common::critical("malformed audit entry key");
  }
  auto value = make_bytes_view(row->second);
  return stored_entry{.id = *id,
                      .entry = encoder_.try_decode<audit_entry_t>(value)};
}

audit_store::audit_store(storage_t& storage, encoder_t& encoder)
    : audit_store{storage, encoder, false} {}

audit_store::audit_store(storage_t& storage,
                         encoder_t& encoder,
                         const bool maintenance_mode)
    : storage_{storage}, encoder_{encoder}, maintenance_mode_{maintenance_mode} {
  if (maintenance_mode_) {
    spdlog::warn("Audit store opened in maintenance mode");
  }
}

audit_store audit_store::with_maintenance_mode(storage_t& storage,
                                               encoder_t& encoder) {
  return audit_store{storage, encoder, true};
}

audit_entry_t audit_store::append(audit_entry_t entry) {
  if (entry.tenant_id.empty()) {
    throw vellum::common::validation_error{"tenant_id must not be empty"};
  }
  auto digest = keys::tenant_digest(entry.tenant_id);

  auto lock = std::scoped_lock{mutex_};
  auto last = load_last(digest);
  auto expected_previous = last ? last->content_hash
                                : vellum::chain::hash_chainer::genesis_hash();
  if (entry.previous_hash != expected_previous) {
    throw vellum::common::conflict_error{
        "chain for tenant '" + entry.tenant_id +
        "' moved on; previous_hash no longer matches the last entry"};
  }

  auto counter_key = keys::make_id_counter_key();
  entry.id = load_counter(counter_key) + 1;

  auto batch = std::vector<vellum::storage::write_entry>{};
  batch.push_back({keys::make_entry_key(digest, entry.id),
                   encoder_.encode(entry)});
  batch.push_back({keys::make_id_index_key(entry.id), digest_bytes(digest)});
  batch.push_back({keys::make_last_key(digest), encoder_.encode(entry.id)});
  batch.push_back({keys::make_tenant_key(digest),
                   encoder_.encode(entry.tenant_id)});
  batch.push_back({counter_key, encoder_.encode(entry.id)});
  storage_.write(batch);

  spdlog::info("Appended audit entry {} for tenant '{}' ({})", entry.id,
               entry.tenant_id, to_string(entry.event_type));
  return entry;
}

std::optional<audit_entry_t> audit_store::last_for_tenant(
    const std::string_view tenant_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_last(keys::tenant_digest(tenant_id));
}

std::optional<audit_entry_t> audit_store::get(const entry_id_t id) const {
  auto lock = std::scoped_lock{mutex_};
  auto digest = load_tenant_digest(id);
  if (!digest) {
    return std::nullopt;
  }
  auto key = keys::make_entry_key(*digest, id);
  return storage_.get<audit_entry_t>(encoder_, make_bytes_view(key));
}

entry_cursor audit_store::cursor_for_tenant(
    const std::string_view tenant_id) const {
  auto prefix = keys::make_entry_prefix(tenant_id);
  return entry_cursor{storage_.scan_prefix(make_bytes_view(prefix)), encoder_};
}

std::vector<audit_entry_t> audit_store::list_for_tenant(
    const std::string_view tenant_id) const {
  auto entries = std::vector<audit_entry_t>{};
  auto cursor = cursor_for_tenant(tenant_id);
  while (auto entry = cursor.next()) {
    entries.push_back(std::move(*entry));
  }
  return entries;
}

std::vector<std::string> audit_store::list_tenants() const {
  auto prefix = make_bytes(keys::kTenantPrefix);
  auto tenants = std::vector<std::string>{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    tenants.push_back(encoder_.decode<std::string>(make_bytes_view(value)));
  }
  std::ranges::sort(tenants);
  return tenants;
}

audit_entry_t audit_store::apply_transition(
    const entry_id_t id,
    const std::function<lifecycle_change(const audit_entry_t&)>& decide) {
  auto lock = std::scoped_lock{mutex_};
  auto digest = load_tenant_digest(id);
  if (!digest) {
    throw vellum::common::not_found_error{"audit entry " + std::to_string(id) +
                                          " does not exist"};
  }
  auto entry_key = keys::make_entry_key(*digest, id);
  auto entry =
      storage_.get<audit_entry_t>(encoder_, make_bytes_view(entry_key));
  if (!entry) {
    vellum::common::critical("id index points at a missing audit entry");
  }

  auto change = decide(*entry);
  auto batch = std::vector<vellum::storage::write_entry>{};
  if (change.assign_reference && !entry->sequence_reference) {
    auto counter_key =
        keys::make_reference_counter_key(*digest, entry->event_type);
    auto number = load_counter(counter_key) + 1;
    entry->sequence_reference =
        make_sequence_reference(entry->event_type, number);
    batch.push_back({counter_key, encoder_.encode(number)});
  }
  entry->lifecycle_state = change.state;
  batch.push_back({entry_key, encoder_.encode(*entry)});
  storage_.write(batch);
  return std::move(*entry);
}

void audit_store::overwrite(const audit_entry_t& entry) {
  auto lock = std::scoped_lock{mutex_};
  auto key = keys::make_entry_key(keys::tenant_digest(entry.tenant_id),
                                  entry.id);
  auto batch = std::vector<vellum::storage::write_entry>{};
  batch.push_back({std::move(key), encoder_.encode(entry)});
  storage_.write(batch);
  spdlog::warn("Maintenance overwrite of audit entry {} for tenant '{}'",
               entry.id, entry.tenant_id);
}

void audit_store::erase(const audit_entry_t& entry) {
  auto lock = std::scoped_lock{mutex_};
  auto digest = keys::tenant_digest(entry.tenant_id);

  auto batch = std::vector<vellum::storage::write_entry>{};
  batch.push_back({keys::make_entry_key(digest, entry.id), std::nullopt});
  batch.push_back({keys::make_id_index_key(entry.id), std::nullopt});

  // Keep the last pointer on the highest surviving id.
  auto last_key = keys::make_last_key(digest);
  auto last_id =
      storage_.get<entry_id_t>(encoder_, make_bytes_view(last_key));
  if (last_id && *last_id == entry.id) {
    auto survivor = std::optional<entry_id_t>{};
    auto prefix = keys::make_entry_prefix(digest);
    auto cursor = storage_.scan_prefix(make_bytes_view(prefix));
    while (auto row = cursor.next()) {
      auto id = keys::parse_entry_id(make_bytes_view(row->first));
      if (id && *id != entry.id) {
        survivor = id;
      }
    }
    auto last_value = std::optional<bytes_t>{};
    if (survivor) {
      last_value = encoder_.encode(*survivor);
    }
    batch.push_back({last_key, std::move(last_value)});
  }
  storage_.write(batch);
  spdlog::warn("Maintenance erase of audit entry {} for tenant '{}'", entry.id,
               entry.tenant_id);
}

std::optional<audit_entry_t> audit_store::load_last(
    const hash32_t& tenant_digest) const {
  auto last_key = keys::make_last_key(tenant_digest);
  auto last_id =
      storage_.get<entry_id_t>(encoder_, make_bytes_view(last_key));
  if (!last_id) {
    return std::nullopt;
  }
  auto entry_key = keys::make_entry_key(tenant_digest, *last_id);
  auto entry =
      storage_.get<audit_entry_t>(encoder_, make_bytes_view(entry_key));
  if (!entry) {
    vellum::common::critical("last pointer references a missing audit entry");
  }
  return entry;
}

std::optional<hash32_t> audit_store::load_tenant_digest(
    const entry_id_t id) const {
  auto index_key = keys::make_id_index_key(id);
  auto raw = storage_.get_raw(make_bytes_view(index_key));
  if (!raw) {
    return std::nullopt;
  }
  if (raw->size() != keys::kTenantDigestSize) {
    vellum::common::critical("corrupt id index entry");
  }
  auto digest = hash32_t{};
  std::ranges::copy(*raw, std::begin(digest));
  return digest;
}

uint64_t audit_store::load_counter(const bytes_t& key) const {
  return storage_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
}

}  // namespace vellum::audit
