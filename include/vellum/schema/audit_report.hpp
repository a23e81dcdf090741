#pragma once

#include <vellum/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

// Schema type: audit report.
// Compliance summary of one tenant's entries over a timestamp range.
namespace vellum::schema {

template <uint16_t Version>
struct audit_report;

template <>
struct audit_report<1> final {
  uint16_t version{1};
  tenant_id_t tenant_id;
  std::optional<timestamp_milliseconds_t> from;
  std::optional<timestamp_milliseconds_t> to;
  uint64_t total{};
  std::map<std::string, uint64_t> by_event_type;
  std::map<std::string, uint64_t> by_actor;
  std::map<std::string, uint64_t> by_severity;
  std::map<std::string, uint64_t> by_state;
  uint64_t awaiting_review{};
};

using audit_report_t = audit_report<1>;

}  // namespace vellum::schema
