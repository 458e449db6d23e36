#pragma once

#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/value.hpp>

#include <bitset>
#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace sentinel::schema {

/// A regular expression compiled once at load time. `source` is kept for
/// audit output and fingerprinting.
struct pattern_t final {
  std::string source;
  std::regex compiled;
};

/// Set of permitted bytes, parsed from a character-class body such as
/// "A-Za-z0-9._-".
struct charset_t final {
  std::string source;
  std::bitset<256> allowed;

  bool contains(const char c) const {
    return allowed.test(static_cast<uint8_t>(c));
  }
};

struct string_validator_t final {
  std::optional<std::size_t> max_len;
  std::optional<std::size_t> min_len;
  std::optional<charset_t> allowed_charset;
  std::optional<pattern_t> regex;
  std::vector<std::string> deny_substrings;  // matched literally, in order
  std::optional<pattern_t> deny_regex;
};

struct path_validator_t final {
  std::vector<std::string> allowed_roots;  // normalized absolute paths
  bool allow_subdirectories{true};
  std::string base_directory{"/"};
};

/// One compiled level of a structured-schema document.
struct schema_node_t final {
  std::vector<value_kind_t> types;  // empty accepts any kind
  std::vector<std::string> required;
  std::vector<std::pair<std::string, schema_node_t>> properties;
  std::optional<bool> additional_properties;
  std::shared_ptr<const schema_node_t> items;
  std::optional<pattern_t> pattern;
  std::optional<std::vector<value_t>> enum_values;
  std::optional<double> minimum;
  std::optional<double> maximum;
  std::optional<double> exclusive_minimum;
  std::optional<double> exclusive_maximum;
  std::optional<std::size_t> min_length;
  std::optional<std::size_t> max_length;
  std::optional<std::size_t> min_items;
  std::optional<std::size_t> max_items;
  std::optional<value_t> const_value;
  std::vector<schema_node_t> all_of;
  std::vector<schema_node_t> any_of;
  std::vector<schema_node_t> one_of;
  std::shared_ptr<const schema_node_t> negated;  // "not"
};

struct schema_validator_t final {
  value_t document;  // as written in the policy, used for fingerprinting
  schema_node_t root;
};

using validator_spec_t =
    std::variant<string_validator_t, path_validator_t, schema_validator_t>;

std::string_view validator_type_name(const validator_spec_t& spec);

}  // namespace sentinel::schema
