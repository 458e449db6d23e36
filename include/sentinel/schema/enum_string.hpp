#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace sentinel::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// "a|b|c", used in load-time error messages.
template <typename Enum, std::size_t N>
std::string joined_names(const enum_mappings_t<Enum, N>& mappings) {
  auto out = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    if (!out.empty()) {
      out.push_back('|');
    }
    out.append(name);
  }
  return out;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace sentinel::schema
