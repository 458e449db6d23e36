#pragma once

#include <sentinel/schema/enforcement_mode.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/sink_spec.hpp>
#include <sentinel/schema/validator_spec.hpp>
#include <sentinel/schema/value.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string_view>

namespace sentinel::schema {

/// Immutable set of validators, sinks and the default enforcement mode.
///
/// Construction checks that every validator id a sink requires exists, so a
/// constructed policy never fails a lookup during evaluation. Policies are
/// replaced wholesale on reload, never edited.
class policy_t final {
 public:
  using validator_map_t =
      std::map<validator_id_t, validator_spec_t, std::less<>>;
  using sink_map_t = std::map<sink_id_t, sink_spec_t, std::less<>>;

  /// Throws common::policy_error (unknown_validator_reference) when a sink
  /// requires an id missing from `validators`.
  policy_t(enforcement_mode_t default_mode,
           validator_map_t validators,
           sink_map_t sinks,
           uint16_t version = 1);

  uint16_t version() const { return version_; }
  enforcement_mode_t default_mode() const { return default_mode_; }
  const validator_map_t& validators() const { return validators_; }
  const sink_map_t& sinks() const { return sinks_; }

  /// BLAKE3 digest of describe(); identifies the policy in audit records.
  const hash32_t& fingerprint() const { return fingerprint_; }

  const validator_spec_t* find_validator(std::string_view id) const;
  const sink_spec_t* find_sink(std::string_view id) const;

  /// First sink (in id order) guarding the given qualified function name.
  const sink_spec_t* find_sink_for_function(std::string_view function) const;

  /// Canonical structured description of the whole model.
  value_t describe() const;

 private:
  uint16_t version_{1};
  enforcement_mode_t default_mode_{enforcement_mode_t::block};
  validator_map_t validators_;
  sink_map_t sinks_;
  hash32_t fingerprint_{};
};

using policy_ptr_t = std::shared_ptr<const policy_t>;

value_t describe(const validator_spec_t& spec);
value_t describe(const sink_spec_t& sink);

}  // namespace sentinel::schema
