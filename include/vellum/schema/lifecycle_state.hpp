#pragma once

#include <vellum/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: entry lifecycle state.
// draft -> validated -> archived, with flagged as a review side branch.
namespace vellum::schema {

enum class lifecycle_state_t : uint8_t {
  draft = 0,
  validated = 1,
  flagged = 2,
  archived = 3,
};

inline constexpr auto kLifecycleStateMappings =
    enum_mappings_t<lifecycle_state_t, 4>{{
        {"draft", lifecycle_state_t::draft},
        {"validated", lifecycle_state_t::validated},
        {"flagged", lifecycle_state_t::flagged},
        {"archived", lifecycle_state_t::archived},
    }};

template <>
inline std::optional<lifecycle_state_t> try_from_string<lifecycle_state_t>(
    const std::string_view value) {
  return from_string(value, kLifecycleStateMappings);
}

inline constexpr std::string_view to_string(const lifecycle_state_t value) {
  return to_string(value, kLifecycleStateMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const lifecycle_state_t value) {
  return value == lifecycle_state_t::archived;
}

}  // namespace vellum::schema
