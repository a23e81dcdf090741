#pragma once

#include <vellum/schema/audit_entry.hpp>
#include <scale/scale.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

SCALE_DEFINE_ENUM_VALUE_LIST(
    vellum::schema,
    event_type_t,
    vellum::schema::event_type_t::created,
    vellum::schema::event_type_t::signature_requested,
    vellum::schema::event_type_t::signed_document,
    vellum::schema::event_type_t::verified,
    vellum::schema::event_type_t::rejected,
    vellum::schema::event_type_t::archived,
    vellum::schema::event_type_t::state_changed,
    vellum::schema::event_type_t::viewed,
    vellum::schema::event_type_t::downloaded,
    vellum::schema::event_type_t::location_update,
    vellum::schema::event_type_t::custody_transfer)

SCALE_DEFINE_ENUM_VALUE_LIST(vellum::schema,
                             severity_t,
                             vellum::schema::severity_t::info,
                             vellum::schema::severity_t::warning,
                             vellum::schema::severity_t::error,
                             vellum::schema::severity_t::critical)

SCALE_DEFINE_ENUM_VALUE_LIST(vellum::schema,
                             lifecycle_state_t,
                             vellum::schema::lifecycle_state_t::draft,
                             vellum::schema::lifecycle_state_t::validated,
                             vellum::schema::lifecycle_state_t::flagged,
                             vellum::schema::lifecycle_state_t::archived)

namespace vellum::schema::encoding::scale {

using metadata_row_t = std::tuple<std::string, uint8_t, std::string>;

using subject_row_t = std::tuple<std::string, std::string>;

using entry_row_t = std::tuple<uint16_t,                     // version
                               uint64_t,                     // id
                               std::string,                  // tenant_id
                               std::optional<std::string>,   // sequence_reference
                               vellum::schema::event_type_t,
                               vellum::schema::severity_t,
                               std::string,                  // actor_id
                               uint64_t,                     // timestamp
                               std::optional<subject_row_t>,
                               std::string,                  // description
                               std::optional<std::string>,   // before_state
                               std::optional<std::string>,   // after_state
                               std::vector<metadata_row_t>,
                               std::optional<std::string>,   // ip_address
                               std::optional<std::string>,   // session_id
                               std::optional<std::string>,   // user_agent
                               std::string,                  // content_hash
                               std::string,                  // previous_hash
                               vellum::schema::lifecycle_state_t>;

entry_row_t to_row(const vellum::schema::audit_entry<1>& entry);

/// std::nullopt when the row carries an unknown version or a metadata value
/// that does not parse under its kind tag.
std::optional<vellum::schema::audit_entry<1>> from_row(entry_row_t&& row);

}  // namespace vellum::schema::encoding::scale
