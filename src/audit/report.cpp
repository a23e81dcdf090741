#include <vellum/audit/report.hpp>

using namespace vellum::schema;

namespace vellum::audit {

audit_report_t build_report(const audit_store& store,
                            const std::string_view tenant_id,
                            const std::optional<timestamp_milliseconds_t> from,
                            const std::optional<timestamp_milliseconds_t> to) {
  auto report = audit_report_t{};
  report.tenant_id = std::string{tenant_id};
  report.from = from;
  report.to = to;

  auto cursor = store.cursor_for_tenant(tenant_id);
  while (auto entry = cursor.next()) {
    if ((from && entry->timestamp < *from) || (to && entry->timestamp > *to)) {
      continue;
    }
    ++report.total;
    ++report.by_event_type[std::string{to_string(entry->event_type)}];
    ++report.by_actor[entry->actor_id];
    ++report.by_severity[std::string{to_string(entry->severity)}];
    ++report.by_state[std::string{to_string(entry->lifecycle_state)}];
    if (requires_escalation(entry->severity) &&
        (entry->lifecycle_state == lifecycle_state_t::draft ||
         entry->lifecycle_state == lifecycle_state_t::flagged)) {
      ++report.awaiting_review;
    }
  }
  return report;
}

}  // namespace vellum::audit
