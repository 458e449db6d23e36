#include <sentinel/common/critical.hpp>
#include <sentinel/common/error.hpp>
#include <sentinel/execution/engine.hpp>
#include <sentinel/validation/validator.hpp>

#include <spdlog/spdlog.h>

namespace sentinel::execution {

using sentinel::schema::decision_t;
using sentinel::schema::enforcement_mode_t;
using sentinel::schema::value_t;

const evaluation_step_t* evaluation_t::failure() const {
  if (steps.empty() || steps.back().outcome == step_outcome_t::passed) {
    return nullptr;
  }
  return &steps.back();
}

decider::decider(sentinel::schema::policy_ptr_t policy,
                 const std::string_view sink_id)
    : policy_{std::move(policy)} {
  if (!policy_) {
    sentinel::common::critical("decider bound without a policy");
  }
  sink_ = policy_->find_sink(sink_id);
  if (sink_ == nullptr) {
    throw common::unknown_sink_error{std::string{sink_id}};
  }
  validators_.reserve(sink_->required_validator_ids.size());
  for (const auto& id : sink_->required_validator_ids) {
    // policy_t guarantees every required id resolves.
    validators_.emplace_back(&id, policy_->find_validator(id));
  }
  spdlog::debug("bound sink '{}' with {} validator(s)", sink_->id,
                validators_.size());
}

enforcement_mode_t decider::effective_mode() const {
  return sink_->mode_override.value_or(policy_->default_mode());
}

decision_t decider::decide(const value_t& value) const {
  return decide(std::span<const value_t>{&value, 1});
}

decision_t decider::decide(const std::span<const value_t> arguments) const {
  return evaluate(arguments).decision;
}

evaluation_t decider::evaluate(const std::span<const value_t> arguments,
                               const argument_view_t& view) const {
  if (arguments.empty()) {
    auto validator_id = validators_.empty() ? std::string{}
                                            : *validators_.front().first;
    throw common::evaluation_error{
        std::move(validator_id),
        "sink '" + sink_->id + "' received no arguments to validate"};
  }

  auto result = evaluation_t{};
  result.sink_id = sink_->id;
  result.decision = sentinel::schema::allow_t{};
  result.effective_mode = effective_mode();

  for (const auto& [id, spec] : validators_) {
    for (auto index = std::size_t{0}; index < arguments.size(); ++index) {
      const auto& seen =
          view ? view(*spec, arguments[index]) : arguments[index];
      auto outcome = validation::evaluate(*id, *spec, seen);
      auto& step = result.steps.emplace_back();
      step.validator_id = *id;
      step.argument_index = index;
      if (outcome.passed()) {
        continue;
      }

      step.reason = outcome.failure;
      step.detail = std::move(outcome.detail);
      switch (result.effective_mode) {
        case enforcement_mode_t::block:
          step.outcome = step_outcome_t::failed;
          result.decision = sentinel::schema::block_t{*id, *step.reason};
          break;
        case enforcement_mode_t::warn:
          step.outcome = step_outcome_t::failed;
          result.decision = sentinel::schema::warn_t{*id, *step.reason};
          break;
        case enforcement_mode_t::allow:
          step.outcome = step_outcome_t::suppressed;
          break;
      }
      return result;
    }
  }
  return result;
}

decision_t decide(const std::string_view sink_id,
                  const value_t& value,
                  const sentinel::schema::policy_t& policy) {
  // Non-owning alias; the caller keeps `policy` alive for the call.
  auto borrowed = sentinel::schema::policy_ptr_t{
      sentinel::schema::policy_ptr_t{}, &policy};
  return decider{std::move(borrowed), sink_id}.decide(value);
}

}  // namespace sentinel::execution
