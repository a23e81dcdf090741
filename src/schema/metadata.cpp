#include <vellum/schema/metadata.hpp>
#include <vellum/schema/primitives.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <system_error>

namespace vellum::schema {

namespace {

template <typename T>
std::optional<T> parse_number(const std::string_view text) {
  auto value = T{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

template <typename T>
std::string format_number(const T value) {
  // Large enough for the shortest round-trip form of any double.
  auto buffer = std::array<char, 64>{};
  auto [ptr, ec] =
      std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc{}) {
    return {};
  }
  return std::string{buffer.data(), ptr};
}

}  // namespace

char metadata_kind(const metadata_value_t& value) {
  return std::visit(overloaded{[](const std::string&) { return 's'; },
                               [](const int64_t) { return 'i'; },
                               [](const double) { return 'f'; }},
                    value);
}

std::string to_canonical_string(const metadata_value_t& value) {
  return std::visit(
      overloaded{[](const std::string& text) { return text; },
                 [](const int64_t number) { return format_number(number); },
                 [](const double number) {
                   // -0.0 compares equal to 0.0 and renders the same.
                   return format_number(number == 0.0 ? 0.0 : number);
                 }},
      value);
}

std::optional<metadata_value_t> parse_metadata_value(
    const char kind,
    const std::string_view text) {
  switch (kind) {
    case 's':
      return metadata_value_t{std::string{text}};
    case 'i': {
      auto number = parse_number<int64_t>(text);
      if (!number) {
        return std::nullopt;
      }
      return metadata_value_t{*number};
    }
    case 'f': {
      auto number = parse_number<double>(text);
      if (!number || !std::isfinite(*number)) {
        return std::nullopt;
      }
      return metadata_value_t{*number};
    }
    default:
      return std::nullopt;
  }
}

std::optional<std::string> check_metadata(const metadata_t& metadata) {
  for (const auto& [key, value] : metadata) {
    if (key.empty()) {
      return std::string{"metadata key must not be empty"};
    }
    for (const auto c : key) {
      if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
        return "metadata key '" + key + "' contains a control character";
      }
    }
    if (const auto* number = std::get_if<double>(&value);
        number != nullptr && !std::isfinite(*number)) {
      return "metadata value for '" + key + "' is not a finite number";
    }
  }
  return std::nullopt;
}

}  // namespace vellum::schema
