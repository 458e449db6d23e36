#pragma once

#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/reason_code.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Schema type: decision.
// Verdict for one sink invocation. Block and warn attribute exactly one
// validator: the first to fail in evaluation order.
namespace sentinel::schema {

struct allow_t final {
  bool operator==(const allow_t&) const = default;
};

struct block_t final {
  validator_id_t validator_id;
  reason_code_t reason{};

  bool operator==(const block_t&) const = default;
};

struct warn_t final {
  validator_id_t validator_id;
  reason_code_t reason{};

  bool operator==(const warn_t&) const = default;
};

using decision_t = std::variant<allow_t, block_t, warn_t>;

enum class decision_kind_t : uint8_t { allow = 0, block = 1, warn = 2 };

inline constexpr auto kDecisionKindMappings = std::array{
    std::pair<std::string_view, decision_kind_t>{"allow",
                                                 decision_kind_t::allow},
    std::pair<std::string_view, decision_kind_t>{"block",
                                                 decision_kind_t::block},
    std::pair<std::string_view, decision_kind_t>{"warn",
                                                 decision_kind_t::warn}};

inline constexpr std::string_view to_string(const decision_kind_t value) {
  return to_string(value, kDecisionKindMappings).value_or("unknown");
}

inline decision_kind_t kind_of(const decision_t& decision) {
  return static_cast<decision_kind_t>(decision.index());
}

inline bool is_allow(const decision_t& decision) {
  return std::holds_alternative<allow_t>(decision);
}

inline bool is_block(const decision_t& decision) {
  return std::holds_alternative<block_t>(decision);
}

inline bool is_warn(const decision_t& decision) {
  return std::holds_alternative<warn_t>(decision);
}

/// Attributed validator id; empty for allow.
std::string_view validator_of(const decision_t& decision);

/// Attributed reason; unset for allow.
std::optional<reason_code_t> reason_of(const decision_t& decision);

/// {"decision":"block","validator":"safe_filename","reason":"denied_substring"}
std::string to_json(const decision_t& decision);

}  // namespace sentinel::schema
