#pragma once

#include <sentinel/schema/policy.hpp>
#include <sentinel/schema/value.hpp>

#include <functional>
#include <string_view>

namespace sentinel::policy {

/// Loads the document named by a validator's `schema_ref`.
using schema_resolver_t =
    std::function<sentinel::schema::value_t(std::string_view ref)>;

struct builder_options_t final {
  /// Reject path validators whose roots are not existing directories.
  bool verify_roots_exist{false};
};

/// Turns a parsed policy document into an immutable policy.
///
/// Document shape:
///   version: 1
///   defaults: {mode: block|warn|allow}
///   validators: [{id, type: string|path|json_schema, ...}]
///   sinks: [{id, function, require: [...], on_violation: {mode, message}}]
///
/// Every check happens here; a policy that fails any of them is never
/// constructed. Throws common::policy_error with the matching error code.
class policy_builder final {
 public:
  explicit policy_builder(schema_resolver_t resolver = {},
                          builder_options_t options = {});

  sentinel::schema::policy_ptr_t build(
      const sentinel::schema::value_t& document) const;

 private:
  schema_resolver_t resolver_;
  builder_options_t options_;

  sentinel::schema::validator_spec_t build_validator(
      const std::string& id,
      const sentinel::schema::value_t& entry) const;
};

}  // namespace sentinel::policy
