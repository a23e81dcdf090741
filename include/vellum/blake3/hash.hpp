#pragma once
#include <vellum/schema/primitives.hpp>
#include <string_view>

namespace vellum::blake3 {

vellum::schema::hash32_t hash(const std::string_view& str);
vellum::schema::hash32_t hash(const vellum::schema::bytes_view_t& bytes);

}  // namespace vellum::blake3
