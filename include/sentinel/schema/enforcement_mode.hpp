#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Action taken when a required validator fails and the sink carries no
// override of its own.
namespace sentinel::schema {

enum class enforcement_mode_t : uint8_t { block = 0, warn = 1, allow = 2 };

inline constexpr auto kEnforcementModeMappings = std::array{
    std::pair<std::string_view, enforcement_mode_t>{"block",
                                                    enforcement_mode_t::block},
    std::pair<std::string_view, enforcement_mode_t>{"warn",
                                                    enforcement_mode_t::warn},
    std::pair<std::string_view, enforcement_mode_t>{"allow",
                                                    enforcement_mode_t::allow}};

template <>
inline std::optional<enforcement_mode_t> try_from_string<enforcement_mode_t>(
    const std::string_view value) {
  return from_string(value, kEnforcementModeMappings);
}

inline constexpr std::string_view to_string(const enforcement_mode_t value) {
  return to_string(value, kEnforcementModeMappings).value_or("unknown");
}

}  // namespace sentinel::schema
