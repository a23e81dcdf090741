#pragma once

#include <vellum/schema/audit_entry.hpp>
#include <vellum/schema/event_type.hpp>
#include <vellum/schema/metadata.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/subject_ref.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace vellum::chain {

/// Exactly what the content hash covers.
struct chain_fields final {
  vellum::schema::tenant_id_t tenant_id;
  vellum::schema::event_type_t event_type{};
  vellum::schema::actor_id_t actor_id;
  vellum::schema::timestamp_milliseconds_t timestamp{};
  std::optional<vellum::schema::subject_ref_t> subject_ref;
  std::string description;
  vellum::schema::metadata_t metadata;
  std::string previous_hash;
};

chain_fields make_chain_fields(const vellum::schema::audit_entry_t& entry);

/// Deterministic byte rendering of chain_fields.
///
///   vellum.audit.v1\n
///   tenant_id:<len>:<value>\n
///   event_type:<len>:<snake_case name>\n
///   actor_id:<len>:<value>\n
///   timestamp:<len>:<ISO-8601 UTC, milliseconds>\n
///   subject_ref:<len>:<type len>:<type>/<id> or empty\n
///   description:<len>:<value>\n
///   metadata:<len>:<count>:{<klen>:<key>=<kind>:<vlen>:<value>}\n
///   previous_hash:<len>:<value>\n
class canonical_encoder final {
 public:
  static constexpr std::string_view kHeader{"vellum.audit.v1\n"};

  static vellum::schema::bytes_t encode(const chain_fields& fields);
};

}  // namespace vellum::chain
