#pragma once

#include <spdlog/common.h>
#include <vellum/audit/recorder.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace vellum::config {

inline constexpr uint32_t kDefaultRetentionDays = 2555;

/// Runtime settings of the audit trail service. Command-line values win over
/// values from the --config file.
struct service_config final {
  std::string db_path{"vellum.db"};
  std::string grpc_address{"0.0.0.0:50051"};
  std::string system_actor{"system"};
  std::chrono::milliseconds clock_skew_tolerance{
      vellum::audit::kDefaultClockSkewTolerance};
  std::chrono::milliseconds lock_timeout{vellum::audit::kDefaultLockTimeout};
  uint32_t retention_days{kDefaultRetentionDays};
  std::string log_file{"vellum.log"};
  spdlog::level::level_enum log_level{spdlog::level::info};
  bool verbose{false};
  bool help{false};

  vellum::audit::recorder_options recorder_options() const;
  std::chrono::milliseconds retention() const;
};

/// argv plus the optional INI file named by --config.
service_config parse_service_config(int argc, const char* const argv[]);

std::string usage();

}  // namespace vellum::config
