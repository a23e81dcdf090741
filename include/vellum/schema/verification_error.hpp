#pragma once

#include <vellum/schema/enum_string.hpp>
#include <vellum/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: verification error.
// One integrity break found while walking a tenant chain. Reported to an
// operator as data; never raised and never repaired automatically.
namespace vellum::schema {

enum class verification_error_kind_t : uint8_t {
  invalid_genesis = 0,
  broken_link = 1,
  tampered_entry = 2,
};

inline constexpr auto kVerificationErrorKindMappings =
    enum_mappings_t<verification_error_kind_t, 3>{{
        {"invalid_genesis", verification_error_kind_t::invalid_genesis},
        {"broken_link", verification_error_kind_t::broken_link},
        {"tampered_entry", verification_error_kind_t::tampered_entry},
    }};

template <>
inline std::optional<verification_error_kind_t>
try_from_string<verification_error_kind_t>(const std::string_view value) {
  return from_string(value, kVerificationErrorKindMappings);
}

inline constexpr std::string_view to_string(
    const verification_error_kind_t value) {
  return to_string(value, kVerificationErrorKindMappings).value_or("unknown");
}

struct verification_error_t final {
  verification_error_kind_t kind{};
  entry_id_t entry_id{};

  bool operator==(const verification_error_t&) const = default;
};

}  // namespace vellum::schema
