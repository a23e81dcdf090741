#include <vellum/schema/encoding/scale/audit_entry.hpp>

#include <utility>

using namespace vellum::schema;

namespace vellum::schema::encoding::scale {

entry_row_t to_row(const audit_entry<1>& o) {
  auto subject = std::optional<subject_row_t>{};
  if (o.subject_ref) {
    subject = subject_row_t{o.subject_ref->type, o.subject_ref->id};
  }

  auto metadata = std::vector<metadata_row_t>{};
  metadata.reserve(o.metadata.size());
  for (const auto& [key, value] : o.metadata) {
    metadata.emplace_back(key, static_cast<uint8_t>(metadata_kind(value)),
                          to_canonical_string(value));
  }

  return entry_row_t{o.version,
                     o.id,
                     o.tenant_id,
                     o.sequence_reference,
                     o.event_type,
                     o.severity,
                     o.actor_id,
                     o.timestamp,
                     std::move(subject),
                     o.description,
                     o.before_state,
                     o.after_state,
                     std::move(metadata),
                     o.context.ip_address,
                     o.context.session_id,
                     o.context.user_agent,
                     o.content_hash,
                     o.previous_hash,
                     o.lifecycle_state};
}

std::optional<audit_entry<1>> from_row(entry_row_t&& row) {
  auto o = audit_entry<1>{};
  auto subject = std::optional<subject_row_t>{};
  auto metadata = std::vector<metadata_row_t>{};
  std::tie(o.version, o.id, o.tenant_id, o.sequence_reference, o.event_type,
           o.severity, o.actor_id, o.timestamp, subject, o.description,
           o.before_state, o.after_state, metadata, o.context.ip_address,
           o.context.session_id, o.context.user_agent, o.content_hash,
           o.previous_hash, o.lifecycle_state) = std::move(row);

  if (o.version != 1) {
    return std::nullopt;
  }
  if (subject) {
    o.subject_ref = subject_ref_t{.type = std::move(std::get<0>(*subject)),
                                  .id = std::move(std::get<1>(*subject))};
  }
  for (auto& [key, kind, text] : metadata) {
    auto value = parse_metadata_value(static_cast<char>(kind), text);
    if (!value) {
      return std::nullopt;
    }
    o.metadata.emplace(std::move(key), std::move(*value));
  }
  return o;
}

}  // namespace vellum::schema::encoding::scale
