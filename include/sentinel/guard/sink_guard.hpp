#pragma once

#include <sentinel/audit/journal.hpp>
#include <sentinel/execution/engine.hpp>
#include <sentinel/guard/policy_violation.hpp>
#include <sentinel/schema/decision.hpp>
#include <sentinel/schema/policy.hpp>
#include <sentinel/schema/value.hpp>
#include <sentinel/taint/flow.hpp>
#include <sentinel/taint/tree.hpp>

#include <span>
#include <string_view>
#include <utility>

namespace sentinel::guard {

/// Enforcement point in front of one sink.
///
/// Block throws policy_violation, warn logs and proceeds, allow proceeds
/// silently. A value the validators cannot evaluate is blocked with reason
/// type_mismatch. Every non-allow outcome goes to the journal when one is
/// attached.
class sink_guard final {
 public:
  /// Throws common::unknown_sink_error when `sink_id` is not in `policy`.
  sink_guard(sentinel::schema::policy_ptr_t policy,
             std::string_view sink_id,
             audit::journal* journal = nullptr);

  /// Binds to the sink guarding `function`; throws common::unknown_sink_error
  /// when no sink names it.
  static sink_guard for_function(sentinel::schema::policy_ptr_t policy,
                                 std::string_view function,
                                 audit::journal* journal = nullptr);

  const execution::decider& decider() const { return decider_; }

  sentinel::schema::decision_t enforce(
      std::span<const sentinel::schema::value_t> arguments,
      const audit::event_context_t& context = {},
      const execution::argument_view_t& view = {}) const;

  /// Records the sink on `trail`, then enforces on the stripped value with
  /// the tree's tags and the trail attached to any audit event.
  sentinel::schema::decision_t enforce(
      const taint::tainted_tree_t& argument,
      taint::flow_trail* trail = nullptr,
      const execution::argument_view_t& view = {}) const;

  /// Enforces, then invokes `operation` only if the decision allows it.
  template <typename Operation>
  decltype(auto) run(std::span<const sentinel::schema::value_t> arguments,
                     Operation&& operation) const {
    enforce(arguments);
    return std::forward<Operation>(operation)();
  }

 private:
  execution::decider decider_;
  audit::journal* journal_{nullptr};
};

}  // namespace sentinel::guard
