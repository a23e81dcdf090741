#include <gtest/gtest.h>
#include <vellum/schema/event_type.hpp>
#include <vellum/schema/lifecycle_state.hpp>
#include <vellum/schema/primitives.hpp>
#include <vellum/schema/sequence_reference.hpp>
#include <vellum/schema/severity.hpp>
#include <vellum/testing/common.hpp>

TEST(primitives, to_hex_is_lowercase) {
  auto bytes = vellum::schema::bytes_t{0x00, 0x0F, 0xAB, 0xFF};
  EXPECT_EQ(vellum::schema::to_hex(bytes), "000fabff");
}

TEST(primitives, bytes_and_strings_convert_both_ways) {
  auto bytes = vellum::schema::make_bytes(std::string_view{"VEL|"});
  EXPECT_EQ(bytes, (vellum::schema::bytes_t{'V', 'E', 'L', '|'}));
  EXPECT_EQ(vellum::schema::make_string(vellum::schema::make_bytes_view(bytes)),
            "VEL|");
}

TEST(primitives, is_hex_digest_requires_64_lowercase_hex) {
  EXPECT_TRUE(vellum::schema::is_hex_digest(std::string(64, 'a')));
  EXPECT_FALSE(vellum::schema::is_hex_digest(std::string(63, 'a')));
  EXPECT_FALSE(vellum::schema::is_hex_digest(std::string(64, 'A')));
  EXPECT_FALSE(vellum::schema::is_hex_digest("GENESIS"));
}

TEST(primitives, format_iso8601_renders_utc_milliseconds) {
  EXPECT_EQ(vellum::schema::format_iso8601(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(vellum::schema::format_iso8601(vellum::testing::kFixedNow),
            "2026-10-19T08:30:00.000Z");
  EXPECT_EQ(vellum::schema::format_iso8601(vellum::testing::kFixedNow + 45123),
            "2026-10-19T08:30:45.123Z");
}

TEST(primitives, enum_names_round_trip) {
  using vellum::schema::event_type_t;
  EXPECT_EQ(vellum::schema::to_string(event_type_t::signed_document), "signed");
  EXPECT_EQ(vellum::schema::try_from_string<event_type_t>("custody_transfer"),
            event_type_t::custody_transfer);
  EXPECT_FALSE(
      vellum::schema::try_from_string<event_type_t>("destroyed").has_value());

  EXPECT_EQ(vellum::schema::try_from_string<vellum::schema::severity_t>(
                "critical"),
            vellum::schema::severity_t::critical);
  EXPECT_EQ(vellum::schema::to_string(vellum::schema::lifecycle_state_t::flagged),
            "flagged");
}

TEST(primitives, severity_escalation_and_terminal_state) {
  EXPECT_FALSE(vellum::schema::requires_escalation(
      vellum::schema::severity_t::warning));
  EXPECT_TRUE(
      vellum::schema::requires_escalation(vellum::schema::severity_t::error));
  EXPECT_TRUE(vellum::schema::is_terminal(
      vellum::schema::lifecycle_state_t::archived));
  EXPECT_FALSE(vellum::schema::is_terminal(
      vellum::schema::lifecycle_state_t::flagged));
}

TEST(primitives, sequence_reference_is_upper_case_and_padded) {
  EXPECT_EQ(vellum::schema::make_sequence_reference(
                vellum::schema::event_type_t::signed_document, 3),
            "SIGNED-000003");
  EXPECT_EQ(vellum::schema::make_sequence_reference(
                vellum::schema::event_type_t::custody_transfer, 1234567),
            "CUSTODY_TRANSFER-1234567");
}
