#include <spdlog/spdlog.h>
#include <vellum/audit/workflow.hpp>
#include <vellum/common/error.hpp>

#include <vector>

using namespace vellum::schema;

namespace vellum::audit {

std::string_view to_string(const transition_t transition) {
  switch (transition) {
    case transition_t::validate:
      return "validate";
    case transition_t::flag_for_review:
      return "flag_for_review";
    case transition_t::resolve_review:
      return "resolve_review";
    case transition_t::archive:
      return "archive";
  }
  return "unknown";
}

workflow::workflow(audit_store& store, notifier& notifier)
    : store_{store}, notifier_{notifier} {}

audit_entry_t workflow::validate(const entry_id_t id) {
  auto entry = transition(id, transition_t::validate, true);
  spdlog::info("Validated audit entry {} as {}", entry.id,
               entry.sequence_reference.value_or(""));
  if (requires_escalation(entry.severity)) {
    notifier_.escalate(entry);
  }
  return entry;
}

audit_entry_t workflow::flag_for_review(const entry_id_t id,
                                        const std::string_view reason) {
  auto entry = transition(id, transition_t::flag_for_review, false);
  spdlog::warn("Flagged audit entry {} for review", entry.id);
  notifier_.request_review(entry, reason);
  return entry;
}

audit_entry_t workflow::resolve_review(const entry_id_t id) {
  auto entry = transition(id, transition_t::resolve_review, true);
  spdlog::info("Resolved review of audit entry {}", entry.id);
  return entry;
}

audit_entry_t workflow::archive(const entry_id_t id) {
  auto entry = transition(id, transition_t::archive, false);
  spdlog::info("Archived audit entry {}", entry.id);
  return entry;
}

std::size_t workflow::archive_expired(
    const std::string_view tenant_id,
    const timestamp_milliseconds_t now,
    const duration_milliseconds_t retention) {
  if (retention > now) {
    return 0;
  }
  const auto cutoff = now - retention;

  auto expired = std::vector<entry_id_t>{};
  auto cursor = store_.cursor_for_tenant(tenant_id);
  while (auto entry = cursor.next()) {
    if (entry->timestamp < cutoff &&
        next_state(transition_t::archive, entry->lifecycle_state)) {
      expired.push_back(entry->id);
    }
  }

  for (const auto id : expired) {
    archive(id);
  }
  if (!expired.empty()) {
    spdlog::info("Archived {} expired audit entries for tenant '{}'",
                 expired.size(), tenant_id);
  }
  return expired.size();
}

audit_entry_t workflow::transition(const entry_id_t id,
                                   const transition_t transition,
                                   const bool assign_reference) {
  return store_.apply_transition(
      id, [&](const audit_entry_t& entry) {
        auto target = next_state(transition, entry.lifecycle_state);
        if (!target) {
          throw vellum::common::invalid_transition_error{
              "cannot " + std::string{to_string(transition)} +
              " audit entry " + std::to_string(entry.id) + " in state " +
              std::string{to_string(entry.lifecycle_state)}};
        }
        return lifecycle_change{.state = *target,
                                .assign_reference = assign_reference};
      });
}

}  // namespace vellum::audit
