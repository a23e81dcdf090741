#include <boost/endian/conversion.hpp>
#include <vellum/blake3/hash.hpp>
#include <vellum/schema/key/audit_keys.hpp>
#include <vellum/schema/key/builder.hpp>

#include <algorithm>
#include <cstring>

namespace vellum::schema::key {

hash32_t tenant_digest(const std::string_view tenant_id) {
  return vellum::blake3::hash(tenant_id);
}

bytes_t make_entry_prefix(const std::string_view tenant_id) {
  return make_entry_prefix(tenant_digest(tenant_id));
}

bytes_t make_entry_prefix(const hash32_t& digest) {
  return builder{}.write(kEntryPrefix).write(digest).data;
}

bytes_t make_entry_key(const hash32_t& digest, const entry_id_t id) {
  return builder{}.write(kEntryPrefix).write(digest).write_big_endian(id).data;
}

bytes_t make_id_index_key(const entry_id_t id) {
  return builder{}.write(kIdIndexPrefix).write_big_endian(id).data;
}

bytes_t make_last_key(const hash32_t& digest) {
  return builder{}.write(kLastPrefix).write(digest).data;
}

bytes_t make_tenant_key(const hash32_t& digest) {
  return builder{}.write(kTenantPrefix).write(digest).data;
}

bytes_t make_id_counter_key() {
  return builder{}.write(kIdCounterKey).data;
}

bytes_t make_reference_counter_key(const hash32_t& digest,
                                   const event_type_t type) {
  return builder{}.write(kReferenceCounterPrefix).write(digest).write(type).data;
}

std::optional<entry_id_t> parse_entry_id(const bytes_view_t& key) {
  constexpr auto kExpectedSize =
      kEntryPrefix.size() + kTenantDigestSize + sizeof(entry_id_t);
  if (key.size() != kExpectedSize ||
      !std::equal(std::begin(kEntryPrefix), std::end(kEntryPrefix),
                  std::begin(key),
                  [](const char a, const uint8_t b) {
                    return static_cast<uint8_t>(a) == b;
                  })) {
    return std::nullopt;
  }
  auto raw = entry_id_t{};
  std::memcpy(&raw, key.data() + kEntryPrefix.size() + kTenantDigestSize,
              sizeof(raw));
  return boost::endian::big_to_native(raw);
}

}  // namespace vellum::schema::key
