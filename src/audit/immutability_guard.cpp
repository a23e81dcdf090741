#include <spdlog/spdlog.h>
#include <vellum/audit/immutability_guard.hpp>
#include <vellum/common/error.hpp>
#include <vellum/schema/metadata.hpp>

#include <algorithm>

using namespace vellum::schema;

namespace vellum::audit {

namespace {

template <typename T>
void assign_if(const std::optional<T>& source, T& target) {
  if (source) {
    target = *source;
  }
}

audit_entry_t load_or_throw(const audit_store& store, const entry_id_t id) {
  auto entry = store.get(id);
  if (!entry) {
    throw vellum::common::not_found_error{"audit entry " + std::to_string(id) +
                                          " does not exist"};
  }
  return std::move(*entry);
}

}  // namespace

bool entry_patch::empty() const {
  return !sequence_reference && !event_type && !severity && !actor_id &&
         !timestamp && !subject_ref && !description && !before_state &&
         !after_state && !metadata && !context && !content_hash &&
         !previous_hash && !lifecycle_state;
}

void entry_patch::apply_to(audit_entry_t& entry) const {
  assign_if(sequence_reference, entry.sequence_reference);
  assign_if(event_type, entry.event_type);
  assign_if(severity, entry.severity);
  assign_if(actor_id, entry.actor_id);
  assign_if(timestamp, entry.timestamp);
  assign_if(subject_ref, entry.subject_ref);
  assign_if(description, entry.description);
  assign_if(before_state, entry.before_state);
  assign_if(after_state, entry.after_state);
  assign_if(metadata, entry.metadata);
  assign_if(context, entry.context);
  assign_if(content_hash, entry.content_hash);
  assign_if(previous_hash, entry.previous_hash);
  assign_if(lifecycle_state, entry.lifecycle_state);
}

immutability_guard::immutability_guard(audit_store& store) : store_{store} {}

audit_entry_t immutability_guard::update(const entry_id_t id,
                                         const entry_patch& patch) {
  auto entry = load_or_throw(store_, id);
  if (patch.empty()) {
    return entry;
  }
  if (!store_.maintenance_mode()) {
    spdlog::warn("Rejected update of immutable audit entry {}", id);
    throw vellum::common::immutable_record_error{
        "audit entry " + std::to_string(id) +
        " is immutable; updates require maintenance mode"};
  }
  if (patch.metadata) {
    if (auto problem = check_metadata(*patch.metadata)) {
      throw vellum::common::validation_error{*problem};
    }
  }
  patch.apply_to(entry);
  store_.overwrite(entry);
  return entry;
}

std::size_t immutability_guard::remove(const std::vector<entry_id_t>& ids) {
  if (ids.empty()) {
    return 0;
  }
  if (!store_.maintenance_mode()) {
    spdlog::warn("Rejected deletion of {} immutable audit entries", ids.size());
    throw vellum::common::immutable_record_error{
        "audit entries cannot be deleted outside maintenance mode"};
  }

  auto unique_ids = ids;
  std::ranges::sort(unique_ids);
  auto [first, last] = std::ranges::unique(unique_ids);
  unique_ids.erase(first, last);

  auto entries = std::vector<audit_entry_t>{};
  entries.reserve(unique_ids.size());
  for (const auto id : unique_ids) {
    entries.push_back(load_or_throw(store_, id));
  }
  for (const auto& entry : entries) {
    store_.erase(entry);
  }
  return entries.size();
}

}  // namespace vellum::audit
