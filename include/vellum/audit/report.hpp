#pragma once

#include <vellum/audit/audit_store.hpp>
#include <vellum/schema/audit_report.hpp>
#include <vellum/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace vellum::audit {

/// Summarize a tenant's entries whose timestamp lies in [from, to]. Either
/// bound may be left open.
vellum::schema::audit_report_t build_report(
    const audit_store& store,
    std::string_view tenant_id,
    std::optional<vellum::schema::timestamp_milliseconds_t> from = std::nullopt,
    std::optional<vellum::schema::timestamp_milliseconds_t> to = std::nullopt);

}  // namespace vellum::audit
