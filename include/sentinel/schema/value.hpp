#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

// Schema type: structured value.
// Generic object/array/scalar tree handed to validators. Objects keep their
// members in declaration order so traversal is deterministic.
namespace sentinel::schema {

struct value_t;

using null_t = std::monostate;
using array_t = std::vector<value_t>;
using member_t = std::pair<std::string, value_t>;
using object_t = std::vector<member_t>;

enum class value_kind_t : uint8_t {
  null = 0,
  boolean = 1,
  integer = 2,
  number = 3,
  string = 4,
  array = 5,
  object = 6
};

struct value_t final {
  using storage_t = std::
      variant<null_t, bool, int64_t, double, std::string, array_t, object_t>;

  storage_t data;

  value_t() = default;
  value_t(std::nullptr_t) {}
  value_t(const bool b) : data{b} {}
  value_t(const int i) : data{static_cast<int64_t>(i)} {}
  value_t(const int64_t i) : data{i} {}
  value_t(const double d) : data{d} {}
  value_t(const char* s) : data{std::string{s}} {}
  value_t(std::string s) : data{std::move(s)} {}
  value_t(array_t a) : data{std::move(a)} {}
  value_t(object_t o) : data{std::move(o)} {}

  value_kind_t kind() const noexcept {
    return static_cast<value_kind_t>(data.index());
  }

  bool is_null() const noexcept { return kind() == value_kind_t::null; }
  bool is_string() const noexcept { return kind() == value_kind_t::string; }
  bool is_object() const noexcept { return kind() == value_kind_t::object; }
  bool is_array() const noexcept { return kind() == value_kind_t::array; }
  bool is_numeric() const noexcept {
    return kind() == value_kind_t::integer || kind() == value_kind_t::number;
  }

  const std::string* string_if() const noexcept {
    return std::get_if<std::string>(&data);
  }
  const object_t* object_if() const noexcept {
    return std::get_if<object_t>(&data);
  }
  const array_t* array_if() const noexcept {
    return std::get_if<array_t>(&data);
  }
  const bool* bool_if() const noexcept { return std::get_if<bool>(&data); }

  /// Numeric view of integer and number values; 0.0 otherwise.
  double as_double() const noexcept;

  /// Member lookup on objects; nullptr when absent or not an object.
  const value_t* find(std::string_view key) const noexcept;

  bool operator==(const value_t& other) const;
};

std::string_view to_string(value_kind_t kind);

/// Compact JSON rendering. Member order is preserved, so equal trees always
/// render to identical text.
std::string to_json(const value_t& value);

/// JSON string literal with escaping, including the surrounding quotes.
std::string quote_json(std::string_view text);

}  // namespace sentinel::schema
