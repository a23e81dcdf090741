#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Schema type: entry metadata.
// Structured side-channel data. std::map keeps keys in ascending byte order,
// which is the order the canonical encoding relies on.
namespace vellum::schema {

using metadata_value_t = std::variant<std::string, int64_t, double>;
using metadata_t = std::map<std::string, metadata_value_t>;

char metadata_kind(const metadata_value_t& value);

std::string to_canonical_string(const metadata_value_t& value);

std::optional<metadata_value_t> parse_metadata_value(char kind,
                                                     std::string_view text);

std::optional<std::string> check_metadata(const metadata_t& metadata);

}  // namespace vellum::schema
