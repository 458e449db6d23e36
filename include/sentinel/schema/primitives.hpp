#pragma once
#include <array>
#include <cstdint>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;

using validator_id_t = std::string;
using sink_id_t = std::string;

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
hash32_t make_zero_hash();

/// Number of Unicode code points in a UTF-8 sequence. Continuation bytes are
/// not counted; malformed sequences count one per lead byte.
std::size_t utf8_length(const std::string_view& text);

}  // namespace sentinel::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
