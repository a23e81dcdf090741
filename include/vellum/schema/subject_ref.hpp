#pragma once

#include <string>

// Schema type: subject reference.
// Opaque pointer at the business record an event concerns (document,
// container, custody record, compliance record). Never dereferenced here.
namespace vellum::schema {

struct subject_ref_t final {
  std::string type;
  std::string id;

  bool operator==(const subject_ref_t&) const = default;
};

}  // namespace vellum::schema
