#include <sentinel/validation/path.hpp>
#include <sentinel/validation/path_validator.hpp>

#include <fmt/format.h>

namespace sentinel::validation {

using sentinel::schema::reason_code_t;

validation_result_t evaluate(const sentinel::schema::path_validator_t& spec,
                             const std::string_view path) {
  const auto normalized = normalize_path(path, spec.base_directory);

  const std::string* matched_root{nullptr};
  for (const auto& root : spec.allowed_roots) {
    if (!is_within(normalized, root)) {
      continue;
    }
    if (spec.allow_subdirectories) {
      return validation_result_t::pass();
    }
    if (normalized != root && parent_of(normalized) == root) {
      return validation_result_t::pass();
    }
    if (matched_root == nullptr) {
      matched_root = &root;
    }
  }

  if (matched_root != nullptr) {
    return validation_result_t::fail(
        reason_code_t::subdirectory_not_allowed,
        fmt::format("'{}' is not a direct child of '{}'", normalized,
                    *matched_root));
  }
  return validation_result_t::fail(
      reason_code_t::path_escape,
      fmt::format("'{}' is not under any allowed root", normalized));
}

}  // namespace sentinel::validation
