#include <spdlog/spdlog.h>
#include <vellum/audit/recorder.hpp>
#include <vellum/chain/canonical_encoder.hpp>
#include <vellum/chain/hash_chainer.hpp>
#include <vellum/common/error.hpp>

#include <utility>

using namespace vellum::schema;

namespace vellum::audit {

recorder::recorder(audit_store& store,
                   workflow& workflow,
                   recorder_options options)
    : store_{store},
      workflow_{workflow},
      options_{std::move(options)},
      locks_{options_.lock_timeout} {}

audit_entry_t recorder::log(const std::string_view tenant_id,
                            const event_type_t event_type,
                            const std::string_view description,
                            const log_options& options) {
  if (tenant_id.empty()) {
    throw vellum::common::validation_error{"tenant_id must not be empty"};
  }
  if (description.empty()) {
    throw vellum::common::validation_error{"description must not be empty"};
  }
  if (auto problem = check_metadata(options.metadata)) {
    throw vellum::common::validation_error{*problem};
  }

  const auto now = options_.clock();
  const auto timestamp = options.timestamp.value_or(now);
  const auto latest_allowed =
      now + static_cast<timestamp_milliseconds_t>(
                options_.clock_skew_tolerance.count());
  if (timestamp > latest_allowed) {
    throw vellum::common::validation_error{
        "timestamp " + format_iso8601(timestamp) + " is in the future"};
  }

  auto entry = audit_entry_t{};
  entry.tenant_id = std::string{tenant_id};
  entry.event_type = event_type;
  entry.severity = options.severity;
  entry.actor_id = options.actor_id && !options.actor_id->empty()
                       ? *options.actor_id
                       : options_.system_actor;
  entry.timestamp = timestamp;
  entry.subject_ref = options.subject_ref;
  entry.description = std::string{description};
  entry.before_state = options.before_state;
  entry.after_state = options.after_state;
  entry.metadata = options.metadata;
  entry.context = options.context;
  entry.lifecycle_state = lifecycle_state_t::draft;

  {
    auto lock = locks_.acquire(tenant_id);
    auto last = store_.last_for_tenant(tenant_id);
    entry.previous_hash = last ? last->content_hash
                               : vellum::chain::hash_chainer::genesis_hash();
    entry.content_hash = vellum::chain::hash_chainer::compute(
        vellum::chain::make_chain_fields(entry));
    entry = store_.append(std::move(entry));
  }

  if (!requires_escalation(entry.severity)) {
    return workflow_.validate(entry.id);
  }
  spdlog::info("Audit entry {} ({}) left in draft for review", entry.id,
               to_string(entry.severity));
  return entry;
}

}  // namespace vellum::audit
