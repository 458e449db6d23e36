#include <sentinel/common/error.hpp>
#include <sentinel/guard/sink_guard.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace sentinel::guard {

using sentinel::schema::decision_t;
using sentinel::schema::value_t;

namespace {

execution::evaluation_t conservative_block(
    const execution::decider& decider,
    const common::evaluation_error& error) {
  auto evaluation = execution::evaluation_t{};
  evaluation.sink_id = decider.sink().id;
  evaluation.effective_mode = sentinel::schema::enforcement_mode_t::block;
  evaluation.decision = sentinel::schema::block_t{
      error.validator_id(), sentinel::schema::reason_code_t::type_mismatch};
  auto& step = evaluation.steps.emplace_back();
  step.validator_id = error.validator_id();
  step.outcome = execution::step_outcome_t::failed;
  step.reason = sentinel::schema::reason_code_t::type_mismatch;
  step.detail = error.what();
  return evaluation;
}

}  // namespace

sink_guard::sink_guard(sentinel::schema::policy_ptr_t policy,
                       const std::string_view sink_id,
                       audit::journal* journal)
    : decider_{std::move(policy), sink_id}, journal_{journal} {}

sink_guard sink_guard::for_function(sentinel::schema::policy_ptr_t policy,
                                    const std::string_view function,
                                    audit::journal* journal) {
  const auto* sink = policy->find_sink_for_function(function);
  if (sink == nullptr) {
    throw common::unknown_sink_error{std::string{function}};
  }
  auto sink_id = sink->id;
  return sink_guard{std::move(policy), sink_id, journal};
}

decision_t sink_guard::enforce(const std::span<const value_t> arguments,
                               const audit::event_context_t& context,
                               const execution::argument_view_t& view) const {
  auto evaluation = execution::evaluation_t{};
  try {
    evaluation = decider_.evaluate(arguments, view);
  } catch (const common::evaluation_error& e) {
    spdlog::error("sink '{}' cannot evaluate its input, blocking: {}",
                  decider_.sink().id, e.what());
    evaluation = conservative_block(decider_, e);
  }

  if (journal_ != nullptr) {
    journal_->record(evaluation, *decider_.policy(), context);
  }

  const auto* failure = evaluation.failure();
  std::visit(
      overloaded{
          [&](const sentinel::schema::allow_t&) {
            if (failure != nullptr) {
              spdlog::debug("sink '{}': {} failed but mode is allow",
                            evaluation.sink_id, failure->validator_id);
            }
          },
          [&](const sentinel::schema::warn_t& warn) {
            spdlog::warn("sink '{}': validator '{}' failed ({}): {}",
                         evaluation.sink_id, warn.validator_id,
                         to_string(warn.reason), failure->detail);
          },
          [&](const sentinel::schema::block_t& block) {
            spdlog::info("sink '{}': blocked by '{}' ({}): {}",
                         evaluation.sink_id, block.validator_id,
                         to_string(block.reason), failure->detail);
            auto message = decider_.sink().violation_message.value_or(
                fmt::format("violation {}: {}", block.validator_id,
                            failure->detail));
            throw policy_violation{evaluation.sink_id, block,
                                   std::move(message)};
          }},
      evaluation.decision);
  return evaluation.decision;
}

decision_t sink_guard::enforce(const taint::tainted_tree_t& argument,
                               taint::flow_trail* trail,
                               const execution::argument_view_t& view) const {
  if (trail != nullptr) {
    trail->record(decider_.sink().id);
  }
  auto context = audit::event_context_t{};
  context.taint_tags = taint::collect_tags(argument);
  if (trail != nullptr) {
    context.taint_flow = trail->points();
  }
  const auto plain = taint::strip(argument);
  return enforce(std::span<const value_t>{&plain, 1}, context, view);
}

}  // namespace sentinel::guard
