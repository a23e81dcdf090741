#pragma once
#include <vellum/schema/primitives.hpp>
#include <optional>
#include <span>

namespace vellum::schema::encoding {

// Persistence encoding is chosen at build time by tag, the same way the
// storage backend is. Hot swapping is not a goal; the canonical encoding used
// for hashing lives in vellum::chain and never goes through this type.
template <typename Library>
struct encoder {
  template <typename T>
  vellum::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vellum::schema::bytes_t& out);

  template <typename T>
  T decode(const vellum::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vellum::schema::bytes_view_t& bytes);
};

}  // namespace vellum::schema::encoding
