#pragma once

#include <sentinel/schema/decision.hpp>
#include <sentinel/schema/enforcement_mode.hpp>
#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/policy.hpp>
#include <sentinel/schema/reason_code.hpp>
#include <sentinel/schema/value.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sentinel::execution {

enum class step_outcome_t : uint8_t { passed = 0, failed = 1, suppressed = 2 };

inline constexpr auto kStepOutcomeMappings = std::array{
    std::pair<std::string_view, step_outcome_t>{"passed",
                                                step_outcome_t::passed},
    std::pair<std::string_view, step_outcome_t>{"failed",
                                                step_outcome_t::failed},
    std::pair<std::string_view, step_outcome_t>{"suppressed",
                                                step_outcome_t::suppressed}};

inline constexpr std::string_view to_string(const step_outcome_t value) {
  return sentinel::schema::to_string(value, kStepOutcomeMappings)
      .value_or("unknown");
}

/// One validator applied to one argument.
struct evaluation_step_t final {
  sentinel::schema::validator_id_t validator_id;
  std::size_t argument_index{};
  step_outcome_t outcome{step_outcome_t::passed};
  std::optional<sentinel::schema::reason_code_t> reason;
  std::string detail;
};

/// Decision plus the trace that produced it. A failure suppressed by an
/// allow-mode sink shows up as the last step with outcome `suppressed`.
struct evaluation_t final {
  sentinel::schema::sink_id_t sink_id;
  sentinel::schema::decision_t decision;
  std::vector<evaluation_step_t> steps;
  sentinel::schema::enforcement_mode_t effective_mode{};

  /// Last failed or suppressed step, if any.
  const evaluation_step_t* failure() const;
};

/// What a validator sees of one argument. Adapters whose input has more than
/// one facet (a target path and its file name) pass one; without it every
/// validator sees the argument itself.
using argument_view_t = std::function<const sentinel::schema::value_t&(
    const sentinel::schema::validator_spec_t&,
    const sentinel::schema::value_t&)>;

/// A policy bound to one sink.
///
/// Binding resolves the sink and its validators once; deciding never fails a
/// lookup afterwards. The decider holds a reference on the policy snapshot it
/// was built from, so a concurrent reload does not affect it. Every member is
/// const after construction and safe to call from many threads.
class decider final {
 public:
  /// Throws common::unknown_sink_error when `sink_id` is not in `policy`.
  decider(sentinel::schema::policy_ptr_t policy, std::string_view sink_id);

  const sentinel::schema::sink_spec_t& sink() const { return *sink_; }
  const sentinel::schema::policy_ptr_t& policy() const { return policy_; }

  /// Mode applied to the first failure: the sink override, else the policy
  /// default.
  sentinel::schema::enforcement_mode_t effective_mode() const;

  /// Throws common::evaluation_error when a validator cannot evaluate the
  /// shape of `value`.
  sentinel::schema::decision_t decide(
      const sentinel::schema::value_t& value) const;

  /// Validators run in listed order; each validator sees every argument in
  /// order before the next validator runs. The first failing pair is
  /// attributed. An empty `arguments` throws common::evaluation_error.
  sentinel::schema::decision_t decide(
      std::span<const sentinel::schema::value_t> arguments) const;

  evaluation_t evaluate(std::span<const sentinel::schema::value_t> arguments,
                        const argument_view_t& view = {}) const;

 private:
  using bound_validator_t =
      std::pair<const sentinel::schema::validator_id_t*,
                const sentinel::schema::validator_spec_t*>;

  sentinel::schema::policy_ptr_t policy_;
  const sentinel::schema::sink_spec_t* sink_{nullptr};
  std::vector<bound_validator_t> validators_;
};

/// One-shot form of decider{...}.decide(value) for callers that own the
/// policy for the duration of the call.
sentinel::schema::decision_t decide(std::string_view sink_id,
                                    const sentinel::schema::value_t& value,
                                    const sentinel::schema::policy_t& policy);

}  // namespace sentinel::execution
