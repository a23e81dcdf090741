#pragma once

#include <vellum/schema/event_type.hpp>
#include <vellum/schema/lifecycle_state.hpp>
#include <vellum/schema/metadata.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/request_context.hpp>
#include <vellum/schema/severity.hpp>
#include <vellum/schema/subject_ref.hpp>

#include <optional>
#include <string>

// Schema type: audit entry.
// One link of a tenant's hash chain. Everything except lifecycle_state and
// sequence_reference is frozen once the store assigns an id.
namespace vellum::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  entry_id_t id{};
  tenant_id_t tenant_id;
  std::optional<std::string> sequence_reference;
  event_type_t event_type{};
  severity_t severity{};
  actor_id_t actor_id;
  timestamp_milliseconds_t timestamp{};
  std::optional<subject_ref_t> subject_ref;
  std::string description;
  std::optional<std::string> before_state;
  std::optional<std::string> after_state;
  metadata_t metadata;
  request_context_t context;
  std::string content_hash;
  std::string previous_hash;
  lifecycle_state_t lifecycle_state{lifecycle_state_t::draft};

  bool operator==(const audit_entry&) const = default;
};

using audit_entry_t = audit_entry<1>;

}  // namespace vellum::schema
