#include <sentinel/schema/primitives.hpp>

#include <algorithm>
#include <iterator>

namespace sentinel::schema {

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

hash32_t make_zero_hash() {
  auto hash = hash32_t{};
  hash.fill(0);
  return hash;
}

std::size_t utf8_length(const std::string_view& text) {
  return static_cast<std::size_t>(
      std::count_if(std::begin(text), std::end(text), [](const char c) {
        return (static_cast<uint8_t>(c) & 0xC0u) != 0x80u;
      }));
}

}  // namespace sentinel::schema
