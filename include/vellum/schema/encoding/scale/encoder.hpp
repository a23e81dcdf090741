#pragma once
#include <vellum/common/critical.hpp>
#include <vellum/schema/encoding/encoder.hpp>
#include <vellum/schema/encoding/scale/audit_entry.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace vellum::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  vellum::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vellum::schema::bytes_t& out);

  template <typename T>
  T decode(const vellum::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vellum::schema::bytes_view_t& bytes);
};

template <typename T>
vellum::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    vellum::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        vellum::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const vellum::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    vellum::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const vellum::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

// Entries travel through SCALE as a flat row of codec-native types.

template <>
inline vellum::schema::bytes_t
encoder<scale_encoder_tag>::encode<vellum::schema::audit_entry_t>(
    const vellum::schema::audit_entry_t& entry) {
  return encode(scale::to_row(entry));
}

template <>
inline std::optional<vellum::schema::audit_entry_t>
encoder<scale_encoder_tag>::try_decode<vellum::schema::audit_entry_t>(
    const vellum::schema::bytes_view_t& bytes) {
  auto row = try_decode<scale::entry_row_t>(bytes);
  if (!row) {
    return std::nullopt;
  }
  return scale::from_row(std::move(*row));
}

template <>
inline vellum::schema::audit_entry_t
encoder<scale_encoder_tag>::decode<vellum::schema::audit_entry_t>(
    const vellum::schema::bytes_view_t& bytes) {
  auto entry = try_decode<vellum::schema::audit_entry_t>(bytes);
  if (!entry) {
    vellum::common::critical("failed to decode stored audit entry");
  }
  return std::move(*entry);
}

}  // namespace vellum::schema::encoding
