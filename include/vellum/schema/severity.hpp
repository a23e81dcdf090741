#pragma once

#include <vellum/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit severity.
// info and warning entries are validated on record; error and critical wait in
// draft and escalate to compliance reviewers when validated.
namespace vellum::schema {

enum class severity_t : uint8_t {
  info = 0,
  warning = 1,
  error = 2,
  critical = 3,
};

inline constexpr auto kSeverityMappings = enum_mappings_t<severity_t, 4>{{
    {"info", severity_t::info},
    {"warning", severity_t::warning},
    {"error", severity_t::error},
    {"critical", severity_t::critical},
}};

template <>
inline std::optional<severity_t> try_from_string<severity_t>(
    const std::string_view value) {
  return from_string(value, kSeverityMappings);
}

inline constexpr std::string_view to_string(const severity_t value) {
  return to_string(value, kSeverityMappings).value_or("unknown");
}

inline constexpr bool requires_escalation(const severity_t value) {
  return value == severity_t::error || value == severity_t::critical;
}

}  // namespace vellum::schema
