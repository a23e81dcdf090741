#pragma once

#include <vellum/audit/audit_store.hpp>
#include <vellum/audit/tenant_lock_table.hpp>
#include <vellum/audit/workflow.hpp>
#include <vellum/schema/audit_entry.hpp>
#include <vellum/schema/event_type.hpp>
#include <vellum/schema/metadata.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/request_context.hpp>
#include <vellum/schema/severity.hpp>
#include <vellum/schema/subject_ref.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace vellum::audit {

struct log_options final {
  vellum::schema::severity_t severity{vellum::schema::severity_t::info};
  std::optional<vellum::schema::actor_id_t> actor_id;
  std::optional<vellum::schema::timestamp_milliseconds_t> timestamp;
  std::optional<vellum::schema::subject_ref_t> subject_ref;
  std::optional<std::string> before_state;
  std::optional<std::string> after_state;
  vellum::schema::metadata_t metadata;
  vellum::schema::request_context_t context;
};

inline constexpr auto kDefaultClockSkewTolerance =
    std::chrono::milliseconds{std::chrono::minutes{5}};
inline constexpr auto kDefaultLockTimeout = std::chrono::milliseconds{5000};

struct recorder_options final {
  vellum::schema::actor_id_t system_actor{"system"};
  std::chrono::milliseconds clock_skew_tolerance{kDefaultClockSkewTolerance};
  std::chrono::milliseconds lock_timeout{kDefaultLockTimeout};
  std::function<vellum::schema::timestamp_milliseconds_t()> clock{
      &vellum::schema::now_milliseconds};
};

class recorder final {
 public:
  recorder(audit_store& store,
           workflow& workflow,
           recorder_options options = {});

  /// info and warning entries come back validated; error and critical
  /// entries stay in draft.
  vellum::schema::audit_entry_t log(std::string_view tenant_id,
                                    vellum::schema::event_type_t event_type,
                                    std::string_view description,
                                    const log_options& options = {});

  const recorder_options& options() const noexcept { return options_; }

 private:
  audit_store& store_;
  workflow& workflow_;
  recorder_options options_;
  tenant_lock_table locks_;
};

}  // namespace vellum::audit
