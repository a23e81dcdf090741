#include <gtest/gtest.h>
#include <vellum/common/error.hpp>
#include <vellum/service/server.hpp>
#include <vellum/testing/audit_fixture.hpp>

#include <string>

namespace {

vellum::rpc::v1::LogRequest make_log_request(const std::string& tenant,
                                             const std::string& severity) {
  auto request = vellum::rpc::v1::LogRequest{};
  request.set_tenant_id(tenant);
  request.set_event_type("signed");
  request.set_description("signed by u1");
  request.set_severity(severity);
  request.set_actor_id("u1");
  request.mutable_subject_ref()->set_type("document");
  request.mutable_subject_ref()->set_id("D-1");
  (*request.mutable_metadata())["pages"].set_integer(3);
  request.mutable_context()->set_ip_address("10.0.0.1");
  return request;
}

}  // namespace

TEST(service, errors_map_to_status_codes) {
  EXPECT_EQ(vellum::service::to_status(vellum::common::validation_error{"x"})
                .error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(
      vellum::service::to_status(vellum::common::immutable_record_error{"x"})
          .error_code(),
      grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(
      vellum::service::to_status(vellum::common::invalid_transition_error{"x"})
          .error_code(),
      grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(vellum::service::to_status(vellum::common::conflict_error{"x"})
                .error_code(),
            grpc::StatusCode::ABORTED);
  EXPECT_EQ(
      vellum::service::to_status(vellum::common::busy_error{"x"}).error_code(),
      grpc::StatusCode::UNAVAILABLE);
  auto status =
      vellum::service::to_status(vellum::common::not_found_error{"gone"});
  EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
  EXPECT_EQ(status.error_message(), "gone");
}

TEST(service, log_returns_the_wire_entry) {
  auto fixture = vellum::testing::audit_fixture{"vellum_service_log"};
  auto listener = vellum::service::listener{
      fixture.store(), fixture.recorder(), fixture.workflow()};

  auto request = make_log_request("A", "info");
  auto response = vellum::rpc::v1::EntryResponse{};
  auto context = grpc::CallbackServerContext{};
  auto* reactor = listener.Log(&context, &request, &response);
  EXPECT_NE(reactor, nullptr);

  ASSERT_TRUE(response.has_entry());
  const auto& entry = response.entry();
  EXPECT_EQ(entry.id(), 1u);
  EXPECT_EQ(entry.tenant_id(), "A");
  EXPECT_EQ(entry.event_type(), "signed");
  EXPECT_EQ(entry.severity(), "info");
  EXPECT_EQ(entry.lifecycle_state(), "validated");
  EXPECT_EQ(entry.sequence_reference(), "SIGNED-000001");
  EXPECT_EQ(entry.actor_id(), "u1");
  EXPECT_EQ(entry.timestamp_ms(), vellum::testing::kFixedNow);
  EXPECT_EQ(entry.subject_ref().id(), "D-1");
  EXPECT_EQ(entry.metadata().at("pages").integer(), 3);
  EXPECT_EQ(entry.context().ip_address(), "10.0.0.1");
  EXPECT_FALSE(entry.context().has_user_agent());
  EXPECT_EQ(entry.previous_hash(), "GENESIS");

  auto stored = fixture.store().get(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(entry.content_hash(), stored->content_hash);
}

TEST(service, unknown_enum_names_are_rejected) {
  auto fixture = vellum::testing::audit_fixture{"vellum_service_enum"};
  auto listener = vellum::service::listener{
      fixture.store(), fixture.recorder(), fixture.workflow()};

  auto request = make_log_request("A", "catastrophic");
  auto response = vellum::rpc::v1::EntryResponse{};
  auto context = grpc::CallbackServerContext{};
  EXPECT_NE(listener.Log(&context, &request, &response), nullptr);
  EXPECT_FALSE(response.has_entry());

  request = make_log_request("A", "info");
  request.set_event_type("teleported");
  auto second = grpc::CallbackServerContext{};
  EXPECT_NE(listener.Log(&second, &request, &response), nullptr);
  EXPECT_FALSE(response.has_entry());
  EXPECT_TRUE(fixture.store().list_tenants().empty());
}

TEST(service, lifecycle_and_reads_go_through_the_library) {
  auto fixture = vellum::testing::audit_fixture{"vellum_service_lifecycle"};
  auto listener = vellum::service::listener{
      fixture.store(), fixture.recorder(), fixture.workflow()};

  auto log_request = make_log_request("A", "critical");
  auto logged = vellum::rpc::v1::EntryResponse{};
  auto log_context = grpc::CallbackServerContext{};
  listener.Log(&log_context, &log_request, &logged);
  ASSERT_EQ(logged.entry().lifecycle_state(), "draft");

  auto archive_request = vellum::rpc::v1::EntryRequest{};
  archive_request.set_id(logged.entry().id());
  auto archived = vellum::rpc::v1::EntryResponse{};
  auto archive_context = grpc::CallbackServerContext{};
  listener.Archive(&archive_context, &archive_request, &archived);
  EXPECT_FALSE(archived.has_entry());

  auto validated = vellum::rpc::v1::EntryResponse{};
  auto validate_context = grpc::CallbackServerContext{};
  listener.Validate(&validate_context, &archive_request, &validated);
  EXPECT_EQ(validated.entry().lifecycle_state(), "validated");
  EXPECT_EQ(fixture.notifier().notifications().size(), 1u);

  auto flag_request = vellum::rpc::v1::FlagForReviewRequest{};
  flag_request.set_id(logged.entry().id());
  flag_request.set_reason("second look");
  auto flagged = vellum::rpc::v1::EntryResponse{};
  auto flag_context = grpc::CallbackServerContext{};
  listener.FlagForReview(&flag_context, &flag_request, &flagged);
  EXPECT_EQ(flagged.entry().lifecycle_state(), "flagged");

  auto resolved = vellum::rpc::v1::EntryResponse{};
  auto resolve_context = grpc::CallbackServerContext{};
  listener.ResolveReview(&resolve_context, &archive_request, &resolved);
  EXPECT_EQ(resolved.entry().lifecycle_state(), "validated");

  auto verify_request = vellum::rpc::v1::VerifyTenantRequest{};
  verify_request.set_tenant_id("A");
  auto verified = vellum::rpc::v1::VerifyTenantResponse{};
  auto verify_context = grpc::CallbackServerContext{};
  listener.VerifyTenant(&verify_context, &verify_request, &verified);
  EXPECT_TRUE(verified.consistent());
  EXPECT_EQ(verified.errors_size(), 0);

  auto list_request = vellum::rpc::v1::ListForTenantRequest{};
  list_request.set_tenant_id("A");
  auto listed = vellum::rpc::v1::ListForTenantResponse{};
  auto list_context = grpc::CallbackServerContext{};
  listener.ListForTenant(&list_context, &list_request, &listed);
  ASSERT_EQ(listed.entries_size(), 1);
  EXPECT_EQ(listed.entries(0).sequence_reference(), "SIGNED-000001");

  auto report_request = vellum::rpc::v1::ReportRequest{};
  report_request.set_tenant_id("A");
  auto reported = vellum::rpc::v1::ReportResponse{};
  auto report_context = grpc::CallbackServerContext{};
  listener.Report(&report_context, &report_request, &reported);
  EXPECT_EQ(reported.total(), 1u);
  EXPECT_EQ(reported.by_severity().at("critical"), 1u);
  EXPECT_EQ(reported.awaiting_review(), 0u);
}
