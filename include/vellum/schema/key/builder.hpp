#pragma once
#include <vellum/schema/event_type.hpp>
#include <vellum/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace vellum::schema::key {

struct builder final {
  vellum::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(event_type_t type);
  builder& write_big_endian(uint64_t value);
};

}  // namespace vellum::schema::key
