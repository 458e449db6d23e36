#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sentinel::common {

enum class error_code_t : uint32_t {
  policy_parse_error = 1,
  unknown_validator_reference = 2,
  invalid_validator_spec = 3,
  duplicate_id = 4,
  unsupported_policy_version = 5,
  unknown_sink = 10,
  type_mismatch = 20,
};

std::string_view to_string(error_code_t code);

/// Base of every error raised by sentinel. Decisions (block/warn) are never
/// reported through this type.
class error : public std::runtime_error {
 public:
  error(error_code_t code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  error_code_t code() const noexcept { return code_; }

 private:
  error_code_t code_;
};

/// Load-time failure. A policy that raised this was never constructed.
class policy_error final : public error {
 public:
  using error::error;
};

/// The value handed to a validator does not have the shape it evaluates.
class evaluation_error final : public error {
 public:
  evaluation_error(std::string validator_id, const std::string& message)
      : error{error_code_t::type_mismatch, message},
        validator_id_{std::move(validator_id)} {}

  const std::string& validator_id() const noexcept { return validator_id_; }

 private:
  std::string validator_id_;
};

class unknown_sink_error final : public error {
 public:
  explicit unknown_sink_error(std::string sink_id)
      : error{error_code_t::unknown_sink, "unknown sink '" + sink_id + "'"},
        sink_id_{std::move(sink_id)} {}

  const std::string& sink_id() const noexcept { return sink_id_; }

 private:
  std::string sink_id_;
};

}  // namespace sentinel::common
