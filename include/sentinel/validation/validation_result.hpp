#pragma once

#include <sentinel/schema/reason_code.hpp>

#include <optional>
#include <string>
#include <utility>

namespace sentinel::validation {

/// Outcome of one validator applied to one value.
struct validation_result_t final {
  std::optional<sentinel::schema::reason_code_t> failure;
  std::string detail;

  bool passed() const noexcept { return !failure.has_value(); }

  static validation_result_t pass() { return {}; }

  static validation_result_t fail(const sentinel::schema::reason_code_t reason,
                                  std::string detail) {
    return {reason, std::move(detail)};
  }
};

}  // namespace sentinel::validation
