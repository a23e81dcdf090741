#pragma once

#include <optional>
#include <string>

// Schema type: request context.
// Where an event came from. Recorded for investigations, not part of the
// content hash.
namespace vellum::schema {

struct request_context_t final {
  std::optional<std::string> ip_address;
  std::optional<std::string> session_id;
  std::optional<std::string> user_agent;

  bool operator==(const request_context_t&) const = default;
};

}  // namespace vellum::schema
