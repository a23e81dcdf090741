#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace vellum::testing {

/// 2026-10-19T08:30:00.000Z
inline constexpr uint64_t kFixedNow = 1792398600000;

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace vellum::testing
