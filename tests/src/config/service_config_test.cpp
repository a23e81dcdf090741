#include <gtest/gtest.h>
#include <vellum/common/error.hpp>
#include <vellum/config/service_config.hpp>
#include <vellum/testing/common.hpp>

#include <chrono>
#include <fstream>
#include <string>
#include <vector>

namespace {

vellum::config::service_config parse(const std::vector<const char*>& args) {
  auto argv = std::vector<const char*>{"vellum_server"};
  argv.insert(std::end(argv), std::begin(args), std::end(args));
  return vellum::config::parse_service_config(static_cast<int>(argv.size()),
                                              argv.data());
}

}  // namespace

TEST(service_config, defaults_match_the_documented_values) {
  auto config = parse({});
  EXPECT_EQ(config.db_path, "vellum.db");
  EXPECT_EQ(config.grpc_address, "0.0.0.0:50051");
  EXPECT_EQ(config.system_actor, "system");
  EXPECT_EQ(config.clock_skew_tolerance, std::chrono::minutes{5});
  EXPECT_EQ(config.lock_timeout, std::chrono::milliseconds{5000});
  EXPECT_EQ(config.retention_days, 2555u);
  EXPECT_EQ(config.retention(), std::chrono::days{2555});
  EXPECT_EQ(config.log_level, spdlog::level::info);
  EXPECT_FALSE(config.help);
  EXPECT_FALSE(config.verbose);
}

TEST(service_config, command_line_overrides) {
  auto config = parse({"--db-path", "/tmp/audit", "--system-actor", "svc",
                       "--clock-skew-tolerance-ms", "1000",
                       "--lock-timeout-ms", "250", "--retention-days", "30",
                       "--log-level", "warn"});
  EXPECT_EQ(config.db_path, "/tmp/audit");
  EXPECT_EQ(config.system_actor, "svc");
  EXPECT_EQ(config.log_level, spdlog::level::warn);

  auto options = config.recorder_options();
  EXPECT_EQ(options.system_actor, "svc");
  EXPECT_EQ(options.clock_skew_tolerance, std::chrono::milliseconds{1000});
  EXPECT_EQ(options.lock_timeout, std::chrono::milliseconds{250});
  EXPECT_EQ(config.retention(), std::chrono::days{30});
}

TEST(service_config, verbose_lowers_the_level_to_debug) {
  EXPECT_EQ(parse({"-v"}).log_level, spdlog::level::debug);
  EXPECT_EQ(parse({"-v", "--log-level", "trace"}).log_level,
            spdlog::level::trace);
  EXPECT_TRUE(parse({"--help"}).help);
}

TEST(service_config, rejects_bad_values) {
  EXPECT_THROW(parse({"--log-level", "loud"}),
               vellum::common::validation_error);
  EXPECT_THROW(parse({"--lock-timeout-ms", "-5"}),
               vellum::common::validation_error);
  EXPECT_THROW(parse({"--lock-timeout-ms", "soon"}),
               vellum::common::validation_error);
  EXPECT_THROW(parse({"--system-actor", ""}),
               vellum::common::validation_error);
  EXPECT_THROW(parse({"--no-such-flag"}), vellum::common::validation_error);
  EXPECT_THROW(parse({"--config", "/nonexistent/vellum.ini"}),
               vellum::common::validation_error);
}

TEST(service_config, config_file_fills_in_and_command_line_wins) {
  auto path = vellum::testing::make_db_path("vellum_config") + ".ini";
  {
    auto file = std::ofstream{path};
    file << "db-path=/var/lib/vellum\n"
         << "grpc-address=127.0.0.1:6000\n"
         << "retention-days=90\n";
  }

  auto config = parse({"--config", path.c_str(), "--retention-days", "7"});
  EXPECT_EQ(config.db_path, "/var/lib/vellum");
  EXPECT_EQ(config.grpc_address, "127.0.0.1:6000");
  EXPECT_EQ(config.retention_days, 7u);

  vellum::testing::remove_path(path);
}
