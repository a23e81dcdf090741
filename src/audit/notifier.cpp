#include <spdlog/spdlog.h>
#include <vellum/audit/notifier.hpp>

#include <utility>

namespace vellum::audit {

void logging_notifier::escalate(const vellum::schema::audit_entry_t& entry) {
  spdlog::warn("Escalating {} audit entry {} for tenant '{}' to compliance "
               "reviewers: {}",
               to_string(entry.severity), entry.id, entry.tenant_id,
               entry.description);
}

void logging_notifier::request_review(
    const vellum::schema::audit_entry_t& entry,
    const std::string_view reason) {
  spdlog::warn("Audit entry {} for tenant '{}' flagged for review: {}",
               entry.id, entry.tenant_id, reason);
}

void recording_notifier::escalate(const vellum::schema::audit_entry_t& entry) {
  auto lock = std::scoped_lock{mutex_};
  outbox_.push_back(notification_t{.kind = notification_kind_t::escalation,
                                   .entry_id = entry.id,
                                   .tenant_id = entry.tenant_id,
                                   .reason = entry.description});
}

void recording_notifier::request_review(
    const vellum::schema::audit_entry_t& entry,
    const std::string_view reason) {
  auto lock = std::scoped_lock{mutex_};
  outbox_.push_back(notification_t{.kind = notification_kind_t::review_request,
                                   .entry_id = entry.id,
                                   .tenant_id = entry.tenant_id,
                                   .reason = std::string{reason}});
}

std::vector<notification_t> recording_notifier::notifications() const {
  auto lock = std::scoped_lock{mutex_};
  return outbox_;
}

std::vector<notification_t> recording_notifier::drain() {
  auto lock = std::scoped_lock{mutex_};
  return std::exchange(outbox_, {});
}

}  // namespace vellum::audit
