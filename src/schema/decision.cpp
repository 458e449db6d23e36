#include <sentinel/schema/decision.hpp>
#include <sentinel/schema/value.hpp>

namespace sentinel::schema {

std::string_view validator_of(const decision_t& decision) {
  return std::visit(
      overloaded{[](const allow_t&) { return std::string_view{}; },
                 [](const block_t& b) { return std::string_view{b.validator_id}; },
                 [](const warn_t& w) { return std::string_view{w.validator_id}; }},
      decision);
}

std::optional<reason_code_t> reason_of(const decision_t& decision) {
  return std::visit(
      overloaded{
          [](const allow_t&) { return std::optional<reason_code_t>{}; },
          [](const block_t& b) { return std::optional<reason_code_t>{b.reason}; },
          [](const warn_t& w) { return std::optional<reason_code_t>{w.reason}; }},
      decision);
}

std::string to_json(const decision_t& decision) {
  auto out = object_t{};
  out.emplace_back("decision", std::string{to_string(kind_of(decision))});
  if (auto reason = reason_of(decision)) {
    out.emplace_back("validator", std::string{validator_of(decision)});
    out.emplace_back("reason", std::string{to_string(*reason)});
  }
  return to_json(value_t{std::move(out)});
}

}  // namespace sentinel::schema
