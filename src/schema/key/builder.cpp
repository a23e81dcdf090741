#include <boost/endian/buffers.hpp>
#include <algorithm>
#include <iterator>
#include <vellum/schema/key/builder.hpp>

using namespace vellum::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy(str, std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy(bytes, std::back_inserter(data));
  return *this;
}

builder& builder::write(const event_type_t type) {
  data.push_back(static_cast<uint8_t>(type));
  return *this;
}

builder& builder::write_big_endian(const uint64_t value) {
  auto buffer = boost::endian::big_uint64_buf_t{value};
  const auto* first = reinterpret_cast<const uint8_t*>(buffer.data());
  std::copy_n(first, sizeof(buffer), std::back_inserter(data));
  return *this;
}
