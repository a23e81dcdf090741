#pragma once

#include <vellum/schema/event_type.hpp>
#include <vellum/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: audit keys.
// Canonical RocksDB key layout for audit entries, their indexes, and counters.
// Tenant ids are reduced to a 32-byte BLAKE3 digest so one tenant's prefix can
// never be a prefix of another's.
namespace vellum::schema::key {

inline constexpr std::string_view kEntryPrefix{"VEL|ENTRY|"};
inline constexpr std::string_view kIdIndexPrefix{"VEL|ID|"};
inline constexpr std::string_view kLastPrefix{"VEL|LAST|"};
inline constexpr std::string_view kTenantPrefix{"VEL|TENANT|"};
inline constexpr std::string_view kIdCounterKey{"VEL|SEQ|ID"};
inline constexpr std::string_view kReferenceCounterPrefix{"VEL|SEQ|REF|"};

inline constexpr std::size_t kTenantDigestSize = 32;

hash32_t tenant_digest(std::string_view tenant_id);

bytes_t make_entry_prefix(std::string_view tenant_id);
bytes_t make_entry_prefix(const hash32_t& tenant_digest);

bytes_t make_entry_key(const hash32_t& tenant_digest, entry_id_t id);

bytes_t make_id_index_key(entry_id_t id);

bytes_t make_last_key(const hash32_t& tenant_digest);

bytes_t make_tenant_key(const hash32_t& tenant_digest);

bytes_t make_id_counter_key();

bytes_t make_reference_counter_key(const hash32_t& tenant_digest,
                                   event_type_t type);

std::optional<entry_id_t> parse_entry_id(const bytes_view_t& key);

}  // namespace vellum::schema::key
