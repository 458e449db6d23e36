#include <sentinel/common/error.hpp>

namespace sentinel::common {

std::string_view to_string(const error_code_t code) {
  switch (code) {
    case error_code_t::policy_parse_error:
      return "policy_parse_error";
    case error_code_t::unknown_validator_reference:
      return "unknown_validator_reference";
    case error_code_t::invalid_validator_spec:
      return "invalid_validator_spec";
    case error_code_t::duplicate_id:
      return "duplicate_id";
    case error_code_t::unsupported_policy_version:
      return "unsupported_policy_version";
    case error_code_t::unknown_sink:
      return "unknown_sink";
    case error_code_t::type_mismatch:
      return "type_mismatch";
  }
  return "unknown";
}

}  // namespace sentinel::common
