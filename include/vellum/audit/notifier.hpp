#pragma once

#include <vellum/schema/audit_entry.hpp>
#include <vellum/schema/primitives.hpp>

#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::audit {

/// Outbound messages to the compliance-reviewer role.
class notifier {
 public:
  virtual ~notifier() = default;

  virtual void escalate(const vellum::schema::audit_entry_t& entry) = 0;

  virtual void request_review(const vellum::schema::audit_entry_t& entry,
                              std::string_view reason) = 0;
};

class logging_notifier final : public notifier {
 public:
  void escalate(const vellum::schema::audit_entry_t& entry) override;
  void request_review(const vellum::schema::audit_entry_t& entry,
                      std::string_view reason) override;
};

enum class notification_kind_t : uint8_t {
  escalation = 0,
  review_request = 1,
};

struct notification_t final {
  notification_kind_t kind{};
  vellum::schema::entry_id_t entry_id{};
  vellum::schema::tenant_id_t tenant_id;
  std::string reason;

  bool operator==(const notification_t&) const = default;
};

class recording_notifier final : public notifier {
 public:
  void escalate(const vellum::schema::audit_entry_t& entry) override;
  void request_review(const vellum::schema::audit_entry_t& entry,
                      std::string_view reason) override;

  std::vector<notification_t> notifications() const;
  std::vector<notification_t> drain();

 private:
  mutable std::mutex mutex_;
  std::vector<notification_t> outbox_;
};

}  // namespace vellum::audit
