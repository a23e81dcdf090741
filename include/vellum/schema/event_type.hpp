#pragma once

#include <vellum/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit event type.
// Union of the NAID compliance log and the signed-document trail event kinds.
namespace vellum::schema {

enum class event_type_t : uint8_t {
  created = 0,
  signature_requested = 1,
  signed_document = 2,
  verified = 3,
  rejected = 4,
  archived = 5,
  state_changed = 6,
  viewed = 7,
  downloaded = 8,
  location_update = 9,
  custody_transfer = 10,
};

inline constexpr auto kEventTypeMappings = enum_mappings_t<event_type_t, 11>{{
    {"created", event_type_t::created},
    {"signature_requested", event_type_t::signature_requested},
    {"signed", event_type_t::signed_document},
    {"verified", event_type_t::verified},
    {"rejected", event_type_t::rejected},
    {"archived", event_type_t::archived},
    {"state_changed", event_type_t::state_changed},
    {"viewed", event_type_t::viewed},
    {"downloaded", event_type_t::downloaded},
    {"location_update", event_type_t::location_update},
    {"custody_transfer", event_type_t::custody_transfer},
}};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace vellum::schema
