#include <spdlog/fmt/fmt.h>
#include <vellum/schema/sequence_reference.hpp>

#include <algorithm>
#include <cctype>

namespace vellum::schema {

std::string make_sequence_reference(const event_type_t type,
                                    const uint64_t number) {
  auto prefix = std::string{to_string(type)};
  std::ranges::transform(prefix, std::begin(prefix), [](const char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return fmt::format("{}-{:06}", prefix, number);
}

}  // namespace vellum::schema
