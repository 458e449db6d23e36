#include <sentinel/blake3/hash.hpp>
#include <sentinel/common/error.hpp>
#include <sentinel/schema/policy.hpp>

#include <algorithm>
#include <iterator>

namespace sentinel::schema {

namespace {

value_t make_size(const std::size_t size) {
  return value_t{static_cast<int64_t>(size)};
}

value_t make_strings(const std::vector<std::string>& items) {
  auto out = array_t{};
  out.reserve(items.size());
  std::transform(std::begin(items), std::end(items), std::back_inserter(out),
                 [](const std::string& s) { return value_t{s}; });
  return value_t{std::move(out)};
}

}  // namespace

std::string_view validator_type_name(const validator_spec_t& spec) {
  return std::visit(
      overloaded{[](const string_validator_t&) { return "string"; },
                 [](const path_validator_t&) { return "path"; },
                 [](const schema_validator_t&) { return "json_schema"; }},
      spec);
}

value_t describe(const validator_spec_t& spec) {
  auto out = object_t{};
  out.emplace_back("type", std::string{validator_type_name(spec)});
  std::visit(
      overloaded{
          [&](const string_validator_t& v) {
            if (v.max_len) {
              out.emplace_back("max_len", make_size(*v.max_len));
            }
            if (v.min_len) {
              out.emplace_back("min_len", make_size(*v.min_len));
            }
            if (v.allowed_charset) {
              out.emplace_back("allow_charset", v.allowed_charset->source);
            }
            if (v.regex) {
              out.emplace_back("regex", v.regex->source);
            }
            out.emplace_back("deny_substrings",
                             make_strings(v.deny_substrings));
            if (v.deny_regex) {
              out.emplace_back("deny_regex", v.deny_regex->source);
            }
          },
          [&](const path_validator_t& v) {
            out.emplace_back("must_be_under", make_strings(v.allowed_roots));
            out.emplace_back("allow_subdirectories", v.allow_subdirectories);
            out.emplace_back("base_directory", v.base_directory);
          },
          [&](const schema_validator_t& v) {
            out.emplace_back("schema", v.document);
          }},
      spec);
  return value_t{std::move(out)};
}

value_t describe(const sink_spec_t& sink) {
  auto out = object_t{};
  out.emplace_back("id", sink.id);
  out.emplace_back("function", sink.function);
  out.emplace_back("require", make_strings(sink.required_validator_ids));
  auto on_violation = object_t{};
  if (sink.mode_override) {
    on_violation.emplace_back("mode",
                              std::string{to_string(*sink.mode_override)});
  }
  if (sink.violation_message) {
    on_violation.emplace_back("message", *sink.violation_message);
  }
  out.emplace_back("on_violation", std::move(on_violation));
  return value_t{std::move(out)};
}

policy_t::policy_t(const enforcement_mode_t default_mode,
                   validator_map_t validators,
                   sink_map_t sinks,
                   const uint16_t version)
    : version_{version},
      default_mode_{default_mode},
      validators_{std::move(validators)},
      sinks_{std::move(sinks)} {
  for (auto& [id, sink] : sinks_) {
    if (sink.id.empty()) {
      sink.id = id;
    }
    if (sink.id != id) {
      throw common::policy_error{
          common::error_code_t::policy_parse_error,
          "sink registered as '" + id + "' declares id '" + sink.id + "'"};
    }
    for (const auto& validator_id : sink.required_validator_ids) {
      if (!validators_.contains(validator_id)) {
        throw common::policy_error{
            common::error_code_t::unknown_validator_reference,
            "sink '" + id + "' requires unknown validator '" + validator_id +
                "'"};
      }
    }
  }
  fingerprint_ = sentinel::blake3::hash(to_json(describe()));
}

const validator_spec_t* policy_t::find_validator(
    const std::string_view id) const {
  auto it = validators_.find(id);
  return it == std::end(validators_) ? nullptr : &it->second;
}

const sink_spec_t* policy_t::find_sink(const std::string_view id) const {
  auto it = sinks_.find(id);
  return it == std::end(sinks_) ? nullptr : &it->second;
}

const sink_spec_t* policy_t::find_sink_for_function(
    const std::string_view function) const {
  auto it = std::find_if(std::begin(sinks_), std::end(sinks_),
                         [&](const auto& entry) {
                           return entry.second.function == function;
                         });
  return it == std::end(sinks_) ? nullptr : &it->second;
}

value_t policy_t::describe() const {
  auto validators = array_t{};
  for (const auto& [id, spec] : validators_) {
    auto entry = object_t{};
    entry.emplace_back("id", id);
    auto body = schema::describe(spec);
    for (auto& member : std::get<object_t>(body.data)) {
      entry.push_back(std::move(member));
    }
    validators.emplace_back(std::move(entry));
  }

  auto sinks = array_t{};
  for (const auto& [id, sink] : sinks_) {
    sinks.push_back(schema::describe(sink));
  }

  auto out = object_t{};
  out.emplace_back("version", static_cast<int64_t>(version_));
  out.emplace_back("defaults",
                   object_t{{"mode", std::string{to_string(default_mode_)}}});
  out.emplace_back("validators", std::move(validators));
  out.emplace_back("sinks", std::move(sinks));
  return value_t{std::move(out)};
}

}  // namespace sentinel::schema
