#pragma once

#include <vellum/audit/audit_store.hpp>
#include <vellum/schema/audit_entry.hpp>
#include <vellum/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vellum::audit {

/// Field-level replacement for a stored entry. Unset fields are left alone.
/// tenant_id and id are not patchable: they address the stored row.
struct entry_patch final {
  std::optional<std::optional<std::string>> sequence_reference;
  std::optional<vellum::schema::event_type_t> event_type;
  std::optional<vellum::schema::severity_t> severity;
  std::optional<vellum::schema::actor_id_t> actor_id;
  std::optional<vellum::schema::timestamp_milliseconds_t> timestamp;
  std::optional<std::optional<vellum::schema::subject_ref_t>> subject_ref;
  std::optional<std::string> description;
  std::optional<std::optional<std::string>> before_state;
  std::optional<std::optional<std::string>> after_state;
  std::optional<vellum::schema::metadata_t> metadata;
  std::optional<vellum::schema::request_context_t> context;
  std::optional<std::string> content_hash;
  std::optional<std::string> previous_hash;
  std::optional<vellum::schema::lifecycle_state_t> lifecycle_state;

  bool empty() const;
  void apply_to(vellum::schema::audit_entry_t& entry) const;
};

/// The only path to rewriting or removing persisted entries. Refused outside
/// maintenance mode; inside it changes are written without rehashing.
class immutability_guard final {
 public:
  explicit immutability_guard(audit_store& store);

  /// An empty patch returns the stored entry unchanged in any mode.
  vellum::schema::audit_entry_t update(vellum::schema::entry_id_t id,
                                       const entry_patch& patch);

  std::size_t remove(const std::vector<vellum::schema::entry_id_t>& ids);

 private:
  audit_store& store_;
};

}  // namespace vellum::audit
