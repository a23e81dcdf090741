#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

// Error taxonomy for the audit trail. Every failure a caller can act on is one
// of these; none are logged and dropped inside the library.
namespace vellum::common {

enum class error_code : uint32_t {
  validation = 1,
  immutable_record = 2,
  invalid_transition = 3,
  conflict = 4,
  busy = 5,
  not_found = 6,
};

constexpr std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::validation:
      return "validation";
    case error_code::immutable_record:
      return "immutable_record";
    case error_code::invalid_transition:
      return "invalid_transition";
    case error_code::conflict:
      return "conflict";
    case error_code::busy:
      return "busy";
    case error_code::not_found:
      return "not_found";
  }
  return "unknown";
}

class error : public std::runtime_error {
 public:
  error(const error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  error_code code() const noexcept { return code_; }

 private:
  error_code code_;
};

/// Malformed input: future timestamp, bad metadata, missing required field.
class validation_error final : public error {
 public:
  explicit validation_error(const std::string& message)
      : error{error_code::validation, message} {}
};

class immutable_record_error final : public error {
 public:
  explicit immutable_record_error(const std::string& message)
      : error{error_code::immutable_record, message} {}
};

class invalid_transition_error final : public error {
 public:
  explicit invalid_transition_error(const std::string& message)
      : error{error_code::invalid_transition, message} {}
};

/// The tenant chain moved on between reading the last entry and appending.
class conflict_error final : public error {
 public:
  explicit conflict_error(const std::string& message)
      : error{error_code::conflict, message} {}
};

class busy_error final : public error {
 public:
  explicit busy_error(const std::string& message)
      : error{error_code::busy, message} {}
};

class not_found_error final : public error {
 public:
  explicit not_found_error(const std::string& message)
      : error{error_code::not_found, message} {}
};

}  // namespace vellum::common
