#include <gtest/gtest.h>
#include <vellum/audit/workflow.hpp>
#include <vellum/common/error.hpp>
#include <vellum/testing/audit_fixture.hpp>

#include <cstddef>

using vellum::audit::transition_t;
using vellum::schema::event_type_t;
using vellum::schema::lifecycle_state_t;
using vellum::schema::severity_t;

namespace {

vellum::audit::log_options with_severity(const severity_t severity) {
  auto options = vellum::audit::log_options{};
  options.severity = severity;
  return options;
}

}  // namespace

TEST(workflow, transition_table_has_no_way_back) {
  for (const auto& rule : vellum::audit::kTransitionRules) {
    EXPECT_NE(rule.to, lifecycle_state_t::draft);
    EXPECT_NE(rule.from, lifecycle_state_t::archived);
  }
  static_assert(vellum::audit::next_state(transition_t::validate,
                                          lifecycle_state_t::draft) ==
                lifecycle_state_t::validated);
  static_assert(!vellum::audit::next_state(transition_t::archive,
                                           lifecycle_state_t::draft));
  EXPECT_EQ(vellum::audit::to_string(transition_t::resolve_review),
            "resolve_review");
}

TEST(workflow, archiving_a_draft_is_refused) {
  auto fixture = vellum::testing::audit_fixture{"vellum_workflow_draft"};
  auto entry = fixture.recorder().log("A", event_type_t::rejected, "mismatch",
                                      with_severity(severity_t::error));
  ASSERT_EQ(entry.lifecycle_state, lifecycle_state_t::draft);

  EXPECT_THROW(fixture.workflow().archive(entry.id),
               vellum::common::invalid_transition_error);
  EXPECT_THROW(fixture.workflow().resolve_review(entry.id),
               vellum::common::invalid_transition_error);
  EXPECT_EQ(fixture.store().get(entry.id)->lifecycle_state,
            lifecycle_state_t::draft);
}

TEST(workflow, validation_happens_once) {
  auto fixture = vellum::testing::audit_fixture{"vellum_workflow_twice"};
  auto entry = fixture.recorder().log("A", event_type_t::viewed, "opened");
  ASSERT_EQ(entry.lifecycle_state, lifecycle_state_t::validated);
  EXPECT_THROW(fixture.workflow().validate(entry.id),
               vellum::common::invalid_transition_error);
  EXPECT_THROW(fixture.workflow().validate(entry.id + 1),
               vellum::common::not_found_error);
}

TEST(workflow, validating_severe_entries_escalates) {
  auto fixture = vellum::testing::audit_fixture{"vellum_workflow_escalate"};
  auto entry =
      fixture.recorder().log("A", event_type_t::rejected, "seal broken",
                             with_severity(severity_t::critical));

  auto validated = fixture.workflow().validate(entry.id);
  EXPECT_EQ(validated.lifecycle_state, lifecycle_state_t::validated);
  EXPECT_EQ(validated.sequence_reference, "REJECTED-000001");
  EXPECT_EQ(validated.content_hash, entry.content_hash);

  auto sent = fixture.notifier().drain();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0], (vellum::audit::notification_t{
                         .kind = vellum::audit::notification_kind_t::escalation,
                         .entry_id = entry.id,
                         .tenant_id = "A",
                         .reason = "seal broken"}));
  EXPECT_TRUE(fixture.notifier().notifications().empty());
  EXPECT_TRUE(fixture.verifier().verify_tenant("A").empty());
}

TEST(workflow, review_cycle_returns_to_validated) {
  auto fixture = vellum::testing::audit_fixture{"vellum_workflow_review"};
  auto entry = fixture.recorder().log("A", event_type_t::downloaded, "export");

  auto flagged = fixture.workflow().flag_for_review(entry.id, "odd hour");
  EXPECT_EQ(flagged.lifecycle_state, lifecycle_state_t::flagged);
  EXPECT_EQ(fixture.workflow().flag_for_review(entry.id, "again")
                .lifecycle_state,
            lifecycle_state_t::flagged);

  auto sent = fixture.notifier().drain();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].kind, vellum::audit::notification_kind_t::review_request);
  EXPECT_EQ(sent[0].reason, "odd hour");

  auto resolved = fixture.workflow().resolve_review(entry.id);
  EXPECT_EQ(resolved.lifecycle_state, lifecycle_state_t::validated);
  EXPECT_EQ(resolved.sequence_reference, entry.sequence_reference);
}

TEST(workflow, flagged_draft_gets_a_reference_on_resolve) {
  auto fixture = vellum::testing::audit_fixture{"vellum_workflow_flag_draft"};
  auto entry = fixture.recorder().log("A", event_type_t::rejected, "mismatch",
                                      with_severity(severity_t::error));
  fixture.workflow().flag_for_review(entry.id, "check signer");
  auto resolved = fixture.workflow().resolve_review(entry.id);
  EXPECT_EQ(resolved.sequence_reference, "REJECTED-000001");
}

TEST(workflow, archived_is_terminal) {
  auto fixture = vellum::testing::audit_fixture{"vellum_workflow_archive"};
  auto entry = fixture.recorder().log("A", event_type_t::created, "opened");
  auto archived = fixture.workflow().archive(entry.id);
  EXPECT_EQ(archived.lifecycle_state, lifecycle_state_t::archived);

  EXPECT_THROW(fixture.workflow().archive(entry.id),
               vellum::common::invalid_transition_error);
  EXPECT_THROW(fixture.workflow().flag_for_review(entry.id, "late"),
               vellum::common::invalid_transition_error);
  EXPECT_THROW(fixture.workflow().validate(entry.id),
               vellum::common::invalid_transition_error);
}

TEST(workflow, archive_expired_only_touches_old_archivable_entries) {
  auto fixture = vellum::testing::audit_fixture{"vellum_workflow_expired"};
  const auto day = uint64_t{24} * 60 * 60 * 1000;

  auto options = vellum::audit::log_options{};
  options.timestamp = vellum::testing::kFixedNow - 10 * day;
  auto old_validated =
      fixture.recorder().log("A", event_type_t::created, "old", options);
  options.severity = severity_t::error;
  auto old_draft =
      fixture.recorder().log("A", event_type_t::rejected, "old draft", options);
  auto fresh = fixture.recorder().log("A", event_type_t::created, "fresh");

  EXPECT_EQ(fixture.workflow().archive_expired("A", vellum::testing::kFixedNow,
                                               vellum::testing::kFixedNow + 1),
            0u);
  EXPECT_EQ(fixture.workflow().archive_expired("A", vellum::testing::kFixedNow,
                                               5 * day),
            1u);

  EXPECT_EQ(fixture.store().get(old_validated.id)->lifecycle_state,
            lifecycle_state_t::archived);
  EXPECT_EQ(fixture.store().get(old_draft.id)->lifecycle_state,
            lifecycle_state_t::draft);
  EXPECT_EQ(fixture.store().get(fresh.id)->lifecycle_state,
            lifecycle_state_t::validated);
  EXPECT_EQ(fixture.store().list_for_tenant("A").size(), 3u);
  EXPECT_TRUE(fixture.verifier().verify_tenant("A").empty());
}
