#pragma once

#include <vellum/audit/audit_store.hpp>
#include <vellum/audit/notifier.hpp>
#include <vellum/schema/audit_entry.hpp>
#include <vellum/schema/lifecycle_state.hpp>
#include <vellum/schema/primitives.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vellum::audit {

enum class transition_t : uint8_t {
  validate = 0,
  flag_for_review = 1,
  resolve_review = 2,
  archive = 3,
};

std::string_view to_string(transition_t transition);

struct transition_rule final {
  transition_t transition{};
  vellum::schema::lifecycle_state_t from{};
  vellum::schema::lifecycle_state_t to{};
};

/// Every permitted lifecycle edge. Nothing leads back to draft and nothing
/// leaves archived.
inline constexpr auto kTransitionRules = std::array<transition_rule, 7>{{
    {transition_t::validate, vellum::schema::lifecycle_state_t::draft,
     vellum::schema::lifecycle_state_t::validated},
    {transition_t::flag_for_review, vellum::schema::lifecycle_state_t::draft,
     vellum::schema::lifecycle_state_t::flagged},
    {transition_t::flag_for_review,
     vellum::schema::lifecycle_state_t::validated,
     vellum::schema::lifecycle_state_t::flagged},
    {transition_t::flag_for_review, vellum::schema::lifecycle_state_t::flagged,
     vellum::schema::lifecycle_state_t::flagged},
    {transition_t::resolve_review, vellum::schema::lifecycle_state_t::flagged,
     vellum::schema::lifecycle_state_t::validated},
    {transition_t::archive, vellum::schema::lifecycle_state_t::validated,
     vellum::schema::lifecycle_state_t::archived},
    {transition_t::archive, vellum::schema::lifecycle_state_t::flagged,
     vellum::schema::lifecycle_state_t::archived},
}};

constexpr std::optional<vellum::schema::lifecycle_state_t> next_state(
    const transition_t transition,
    const vellum::schema::lifecycle_state_t from) {
  for (const auto& rule : kTransitionRules) {
    if (rule.transition == transition && rule.from == from) {
      return rule.to;
    }
  }
  return std::nullopt;
}

/// Lifecycle state machine. Hashed fields are never rewritten.
class workflow final {
 public:
  workflow(audit_store& store, notifier& notifier);

  /// Assigns sequence_reference; escalates error and critical entries.
  vellum::schema::audit_entry_t validate(vellum::schema::entry_id_t id);

  vellum::schema::audit_entry_t flag_for_review(vellum::schema::entry_id_t id,
                                                std::string_view reason);

  vellum::schema::audit_entry_t resolve_review(vellum::schema::entry_id_t id);

  vellum::schema::audit_entry_t archive(vellum::schema::entry_id_t id);

  /// Archives validated or flagged entries older than now - retention.
  std::size_t archive_expired(std::string_view tenant_id,
                              vellum::schema::timestamp_milliseconds_t now,
                              vellum::schema::duration_milliseconds_t retention);

 private:
  vellum::schema::audit_entry_t transition(vellum::schema::entry_id_t id,
                                           transition_t transition,
                                           bool assign_reference);

  audit_store& store_;
  notifier& notifier_;
};

}  // namespace vellum::audit
