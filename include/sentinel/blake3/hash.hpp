#pragma once
#include <sentinel/schema/primitives.hpp>
#include <string>
#include <string_view>

namespace sentinel::blake3 {

sentinel::schema::hash32_t hash(const std::string_view& str);
sentinel::schema::hash32_t hash(const sentinel::schema::bytes_view_t& bytes);

/// Hex digest of `str`, as printed by the CLI and audit lines.
std::string hash_hex(const std::string_view& str);

}  // namespace sentinel::blake3
