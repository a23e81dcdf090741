#pragma once

#include <vellum/audit/audit_store.hpp>
#include <vellum/schema/verification_error.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::audit {

/// Each tenant is read from one storage snapshot. Breaks are reported, never
/// repaired.
class chain_verifier final {
 public:
  explicit chain_verifier(const audit_store& store);

  std::vector<vellum::schema::verification_error_t> verify_tenant(
      std::string_view tenant_id) const;

  std::map<std::string, std::vector<vellum::schema::verification_error_t>>
  verify_all() const;

 private:
  const audit_store& store_;
};

}  // namespace vellum::audit
