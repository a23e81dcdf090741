#pragma once

#include <vellum/schema/event_type.hpp>

#include <cstdint>
#include <string>

namespace vellum::schema {

std::string make_sequence_reference(event_type_t type, uint64_t number);

}  // namespace vellum::schema
