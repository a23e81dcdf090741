#pragma once

#include <vellum/chain/canonical_encoder.hpp>
#include <vellum/schema/primitives.hpp>

#include <string>
#include <string_view>

namespace vellum::chain {

/// SHA-256 over canonical entry bytes, rendered as 64 lowercase hex chars.
class hash_chainer final {
 public:
  /// previous_hash of a tenant's first entry.
  static constexpr std::string_view kGenesis{"GENESIS"};

  static std::string hash(const vellum::schema::bytes_view_t& bytes);
  static std::string genesis_hash() { return std::string{kGenesis}; }
  static std::string compute(const chain_fields& fields);
};

}  // namespace vellum::chain
