#include <spdlog/spdlog.h>
#include <vellum/audit/tenant_lock_table.hpp>
#include <vellum/common/error.hpp>

namespace vellum::audit {

tenant_lock_table::tenant_lock_table(const std::chrono::milliseconds timeout)
    : timeout_{timeout} {}

std::unique_lock<std::timed_mutex> tenant_lock_table::acquire(
    const std::string_view tenant_id) {
  auto* tenant_mutex = static_cast<std::timed_mutex*>(nullptr);
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = locks_.find(tenant_id);
    if (it == std::end(locks_)) {
      it = locks_
               .emplace(std::string{tenant_id},
                        std::make_unique<std::timed_mutex>())
               .first;
    }
    tenant_mutex = it->second.get();
  }

  auto lock = std::unique_lock<std::timed_mutex>{*tenant_mutex, std::defer_lock};
  if (!lock.try_lock_for(timeout_)) {
    spdlog::warn("Timed out after {} ms waiting for tenant '{}'",
                 timeout_.count(), tenant_id);
    throw vellum::common::busy_error{"tenant '" + std::string{tenant_id} +
                                     "' is busy; retry later"};
  }
  return lock;
}

}  // namespace vellum::audit
