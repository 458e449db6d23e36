#include <sentinel/common/error.hpp>
#include <sentinel/validation/validator.hpp>

#include <fmt/format.h>

namespace sentinel::validation {

namespace {

[[noreturn]] void mismatch(const std::string_view validator_id,
                           const std::string_view expected,
                           const sentinel::schema::value_t& value) {
  throw common::evaluation_error{
      std::string{validator_id},
      fmt::format("validator '{}' expects {}, got {}", validator_id, expected,
                  sentinel::schema::to_string(value.kind()))};
}

}  // namespace

validation_result_t evaluate(const std::string_view validator_id,
                             const sentinel::schema::validator_spec_t& spec,
                             const sentinel::schema::value_t& value) {
  return std::visit(
      overloaded{
          [&](const sentinel::schema::string_validator_t& s) {
            const auto* text = value.string_if();
            if (text == nullptr) {
              mismatch(validator_id, "a string", value);
            }
            return evaluate(s, *text);
          },
          [&](const sentinel::schema::path_validator_t& p) {
            const auto* text = value.string_if();
            if (text == nullptr) {
              mismatch(validator_id, "a path string", value);
            }
            return evaluate(p, *text);
          },
          [&](const sentinel::schema::schema_validator_t& s) {
            if (!value.is_object() && !value.is_array()) {
              mismatch(validator_id, "an object or array", value);
            }
            return evaluate(s, value);
          }},
      spec);
}

}  // namespace sentinel::validation
