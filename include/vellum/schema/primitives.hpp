#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using entry_id_t = uint64_t;
using tenant_id_t = std::string;
using actor_id_t = std::string;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);

bool is_hex_digest(std::string_view value);

std::string format_iso8601(timestamp_milliseconds_t timestamp);

timestamp_milliseconds_t now_milliseconds();

}  // namespace vellum::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
