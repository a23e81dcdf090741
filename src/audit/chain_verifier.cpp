#include <spdlog/spdlog.h>
#include <vellum/audit/chain_verifier.hpp>
#include <vellum/chain/canonical_encoder.hpp>
#include <vellum/chain/hash_chainer.hpp>

#include <optional>

using namespace vellum::schema;

namespace vellum::audit {

chain_verifier::chain_verifier(const audit_store& store) : store_{store} {}

std::vector<verification_error_t> chain_verifier::verify_tenant(
    const std::string_view tenant_id) const {
  auto errors = std::vector<verification_error_t>{};
  auto first = true;
  // Empty after a row that does not decode; its successor's link is unknown.
  auto previous_hash = std::optional<std::string>{};
  auto checked = std::size_t{0};

  auto cursor = store_.cursor_for_tenant(tenant_id);
  while (auto row = cursor.try_next()) {
    ++checked;
    if (!row->entry) {
      errors.push_back(verification_error_t{
          .kind = verification_error_kind_t::tampered_entry,
          .entry_id = row->id});
      first = false;
      previous_hash.reset();
      continue;
    }

    const auto& entry = row->entry;
    if (first) {
      if (entry->previous_hash != vellum::chain::hash_chainer::genesis_hash()) {
        errors.push_back(verification_error_t{
            .kind = verification_error_kind_t::invalid_genesis,
            .entry_id = entry->id});
      }
    } else if (previous_hash && entry->previous_hash != *previous_hash) {
      errors.push_back(
          verification_error_t{.kind = verification_error_kind_t::broken_link,
                               .entry_id = entry->id});
    }

    auto recomputed = vellum::chain::hash_chainer::compute(
        vellum::chain::make_chain_fields(*entry));
    if (recomputed != entry->content_hash) {
      errors.push_back(verification_error_t{
          .kind = verification_error_kind_t::tampered_entry,
          .entry_id = entry->id});
    }

    first = false;
    previous_hash = entry->content_hash;
  }

  if (errors.empty()) {
    spdlog::debug("Verified {} audit entries for tenant '{}'", checked,
                  tenant_id);
  } else {
    for (const auto& error : errors) {
      spdlog::warn("Chain break in tenant '{}': {} at entry {}", tenant_id,
                   to_string(error.kind), error.entry_id);
    }
  }
  return errors;
}

std::map<std::string, std::vector<verification_error_t>>
chain_verifier::verify_all() const {
  auto results = std::map<std::string, std::vector<verification_error_t>>{};
  for (const auto& tenant_id : store_.list_tenants()) {
    results.emplace(tenant_id, verify_tenant(tenant_id));
  }
  return results;
}

}  // namespace vellum::audit
