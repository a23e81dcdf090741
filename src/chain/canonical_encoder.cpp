#include <spdlog/fmt/fmt.h>
#include <vellum/chain/canonical_encoder.hpp>

#include <iterator>

namespace vellum::chain {

namespace {

void append_field(std::string& out,
                  const std::string_view name,
                  const std::string_view value) {
  fmt::format_to(std::back_inserter(out), "{}:{}:{}\n", name, value.size(),
                 value);
}

std::string render_subject(
    const std::optional<vellum::schema::subject_ref_t>& subject) {
  if (!subject) {
    return {};
  }
  return fmt::format("{}:{}/{}", subject->type.size(), subject->type,
                     subject->id);
}

std::string render_metadata(const vellum::schema::metadata_t& metadata) {
  auto out = fmt::format("{}:", metadata.size());
  for (const auto& [key, value] : metadata) {
    auto text = vellum::schema::to_canonical_string(value);
    fmt::format_to(std::back_inserter(out), "{}:{}={}:{}:{}", key.size(), key,
                   vellum::schema::metadata_kind(value), text.size(), text);
  }
  return out;
}

}  // namespace

chain_fields make_chain_fields(const vellum::schema::audit_entry_t& entry) {
  return chain_fields{.tenant_id = entry.tenant_id,
                      .event_type = entry.event_type,
                      .actor_id = entry.actor_id,
                      .timestamp = entry.timestamp,
                      .subject_ref = entry.subject_ref,
                      .description = entry.description,
                      .metadata = entry.metadata,
                      .previous_hash = entry.previous_hash};
}

vellum::schema::bytes_t canonical_encoder::encode(const chain_fields& fields) {
  auto out = std::string{kHeader};
  append_field(out, "tenant_id", fields.tenant_id);
  append_field(out, "event_type", vellum::schema::to_string(fields.event_type));
  append_field(out, "actor_id", fields.actor_id);
  append_field(out, "timestamp",
               vellum::schema::format_iso8601(fields.timestamp));
  append_field(out, "subject_ref", render_subject(fields.subject_ref));
  append_field(out, "description", fields.description);
  append_field(out, "metadata", render_metadata(fields.metadata));
  append_field(out, "previous_hash", fields.previous_hash);
  return vellum::schema::make_bytes(out);
}

}  // namespace vellum::chain
