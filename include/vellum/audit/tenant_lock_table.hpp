#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace vellum::audit {

/// One timed mutex per tenant. Appends for a tenant are serialized; different
/// tenants never wait on each other.
class tenant_lock_table final {
 public:
  explicit tenant_lock_table(std::chrono::milliseconds timeout);

  std::unique_lock<std::timed_mutex> acquire(std::string_view tenant_id);

  std::chrono::milliseconds timeout() const noexcept { return timeout_; }

 private:
  std::mutex mutex_;
  std::map<std::string, std::unique_ptr<std::timed_mutex>, std::less<>> locks_;
  std::chrono::milliseconds timeout_;
};

}  // namespace vellum::audit
