#include <sentinel/common/error.hpp>
#include <sentinel/policy/builder.hpp>
#include <sentinel/validation/path.hpp>
#include <sentinel/validation/regex_guard.hpp>
#include <sentinel/validation/schema_validator.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <string>

namespace sentinel::policy {

using sentinel::common::error_code_t;
using sentinel::common::policy_error;
using sentinel::schema::enforcement_mode_t;
using sentinel::schema::value_t;

namespace {

[[noreturn]] void fail(const error_code_t code, const std::string& message) {
  throw policy_error{code, message};
}

const sentinel::schema::array_t& list_field(const value_t& entry,
                                            std::string_view key,
                                            const std::string& where) {
  static const auto kEmpty = sentinel::schema::array_t{};
  const auto* field = entry.find(key);
  if (field == nullptr || field->is_null()) {
    return kEmpty;
  }
  const auto* list = field->array_if();
  if (list == nullptr) {
    fail(error_code_t::policy_parse_error,
         where + ": '" + std::string{key} + "' must be a list");
  }
  return *list;
}

std::optional<std::string> string_field(const value_t& entry,
                                        std::string_view key,
                                        const std::string& where,
                                        error_code_t code) {
  const auto* field = entry.find(key);
  if (field == nullptr || field->is_null()) {
    return std::nullopt;
  }
  const auto* text = field->string_if();
  if (text == nullptr) {
    fail(code, where + ": '" + std::string{key} + "' must be a string");
  }
  return *text;
}

std::vector<std::string> string_list(const value_t& entry,
                                     std::string_view key,
                                     const std::string& where,
                                     error_code_t code) {
  auto out = std::vector<std::string>{};
  for (const auto& item : list_field(entry, key, where)) {
    const auto* text = item.string_if();
    if (text == nullptr) {
      fail(code, where + ": '" + std::string{key} + "' must list strings");
    }
    out.push_back(*text);
  }
  return out;
}

std::optional<std::size_t> count_field(const value_t& entry,
                                       std::string_view key,
                                       const std::string& where) {
  const auto* field = entry.find(key);
  if (field == nullptr || field->is_null()) {
    return std::nullopt;
  }
  const auto* count = std::get_if<int64_t>(&field->data);
  if (count == nullptr || *count < 0) {
    fail(error_code_t::invalid_validator_spec,
         where + ": '" + std::string{key} +
             "' must be a non-negative integer");
  }
  return static_cast<std::size_t>(*count);
}

std::optional<bool> bool_field(const value_t& entry,
                               std::string_view key,
                               const std::string& where) {
  const auto* field = entry.find(key);
  if (field == nullptr || field->is_null()) {
    return std::nullopt;
  }
  const auto* flag = field->bool_if();
  if (flag == nullptr) {
    fail(error_code_t::invalid_validator_spec,
         where + ": '" + std::string{key} + "' must be a boolean");
  }
  return *flag;
}

enforcement_mode_t parse_mode(const std::string& text,
                              const std::string& where) {
  auto mode = sentinel::schema::try_from_string<enforcement_mode_t>(text);
  if (!mode) {
    fail(error_code_t::policy_parse_error,
         where + ": unknown mode '" + text + "', expected " +
             sentinel::schema::joined_names(
                 sentinel::schema::kEnforcementModeMappings));
  }
  return *mode;
}

sentinel::schema::string_validator_t build_string(const value_t& entry,
                                                  const std::string& where) {
  auto spec = sentinel::schema::string_validator_t{};
  spec.max_len = count_field(entry, "max_len", where);
  spec.min_len = count_field(entry, "min_len", where);
  if (spec.max_len && spec.min_len && *spec.min_len > *spec.max_len) {
    fail(error_code_t::invalid_validator_spec,
         where + ": 'min_len' exceeds 'max_len'");
  }
  if (auto charset = string_field(entry, "allow_charset", where,
                                  error_code_t::invalid_validator_spec)) {
    spec.allowed_charset =
        validation::compile_charset(*charset, where + ".allow_charset");
  }
  if (auto regex = string_field(entry, "regex", where,
                                error_code_t::invalid_validator_spec)) {
    spec.regex = validation::compile_pattern(*regex, where + ".regex");
  }
  spec.deny_substrings = string_list(entry, "deny_substrings", where,
                                     error_code_t::invalid_validator_spec);
  if (auto deny = string_field(entry, "deny_regex", where,
                               error_code_t::invalid_validator_spec)) {
    spec.deny_regex = validation::compile_pattern(*deny, where + ".deny_regex");
  }
  return spec;
}

sentinel::schema::path_validator_t build_path(const value_t& entry,
                                              const std::string& where,
                                              const builder_options_t& options) {
  auto spec = sentinel::schema::path_validator_t{};
  if (auto base = string_field(entry, "base_directory", where,
                               error_code_t::invalid_validator_spec)) {
    if (!base->starts_with('/')) {
      fail(error_code_t::invalid_validator_spec,
           where + ": 'base_directory' must be absolute");
    }
    spec.base_directory = validation::normalize_path(*base);
  }

  auto roots = string_list(entry, "must_be_under", where,
                           error_code_t::invalid_validator_spec);
  if (roots.empty()) {
    roots = string_list(entry, "allowed_roots", where,
                        error_code_t::invalid_validator_spec);
  }
  if (roots.empty()) {
    spdlog::warn("{} has no allowed roots; every path will be rejected",
                 where);
  }
  for (const auto& root : roots) {
    auto normalized = validation::normalize_path(root, spec.base_directory);
    if (options.verify_roots_exist &&
        !std::filesystem::is_directory(normalized)) {
      fail(error_code_t::invalid_validator_spec,
           where + ": root '" + normalized + "' is not a directory");
    }
    spec.allowed_roots.push_back(std::move(normalized));
  }

  const auto deny = bool_field(entry, "deny_subdirectories", where);
  const auto allow = bool_field(entry, "allow_subdirectories", where);
  if (deny && allow && *deny == *allow) {
    fail(error_code_t::invalid_validator_spec,
         where + ": 'deny_subdirectories' contradicts 'allow_subdirectories'");
  }
  if (deny) {
    spec.allow_subdirectories = !*deny;
  } else if (allow) {
    spec.allow_subdirectories = *allow;
  }
  return spec;
}

}  // namespace

policy_builder::policy_builder(schema_resolver_t resolver,
                               builder_options_t options)
    : resolver_{std::move(resolver)}, options_{options} {}

sentinel::schema::validator_spec_t policy_builder::build_validator(
    const std::string& id,
    const value_t& entry) const {
  const auto where = "validator '" + id + "'";
  const auto type = string_field(entry, "type", where,
                                 error_code_t::invalid_validator_spec);
  if (!type) {
    fail(error_code_t::invalid_validator_spec, where + ": missing 'type'");
  }

  if (*type == "string") {
    return build_string(entry, where);
  }
  if (*type == "path") {
    return build_path(entry, where, options_);
  }
  if (*type == "json_schema") {
    auto spec = sentinel::schema::schema_validator_t{};
    if (const auto* inline_schema = entry.find("schema")) {
      spec.document = *inline_schema;
    } else if (auto ref = string_field(entry, "schema_ref", where,
                                       error_code_t::invalid_validator_spec)) {
      if (!resolver_) {
        fail(error_code_t::invalid_validator_spec,
             where + ": 'schema_ref' cannot be resolved here");
      }
      spec.document = resolver_(*ref);
    } else {
      fail(error_code_t::invalid_validator_spec,
           where + ": needs 'schema' or 'schema_ref'");
    }
    spec.root = validation::compile_schema(spec.document, where + ".schema");
    return spec;
  }
  fail(error_code_t::invalid_validator_spec,
       where + ": unknown type '" + *type + "'");
}

sentinel::schema::policy_ptr_t policy_builder::build(
    const value_t& document) const {
  if (!document.is_object()) {
    fail(error_code_t::policy_parse_error, "policy must be a mapping");
  }

  auto version = int64_t{1};
  if (const auto* field = document.find("version")) {
    const auto* number = std::get_if<int64_t>(&field->data);
    if (number == nullptr) {
      fail(error_code_t::policy_parse_error, "'version' must be an integer");
    }
    version = *number;
  }
  if (version != 1) {
    fail(error_code_t::unsupported_policy_version,
         "unsupported policy version " + std::to_string(version));
  }

  auto default_mode = enforcement_mode_t::block;
  if (const auto* defaults = document.find("defaults");
      defaults != nullptr && !defaults->is_null()) {
    if (!defaults->is_object()) {
      fail(error_code_t::policy_parse_error, "'defaults' must be a mapping");
    }
    if (auto mode = string_field(*defaults, "mode", "defaults",
                                 error_code_t::policy_parse_error)) {
      default_mode = parse_mode(*mode, "defaults");
    }
  }

  auto validators = sentinel::schema::policy_t::validator_map_t{};
  for (const auto& entry : list_field(document, "validators", "policy")) {
    if (!entry.is_object()) {
      fail(error_code_t::policy_parse_error,
           "validators: entries must be mappings");
    }
    auto id = string_field(entry, "id", "validators",
                           error_code_t::policy_parse_error);
    if (!id || id->empty()) {
      fail(error_code_t::policy_parse_error, "validators: missing 'id'");
    }
    if (validators.contains(*id)) {
      fail(error_code_t::duplicate_id, "duplicate validator id '" + *id + "'");
    }
    validators.emplace(*id, build_validator(*id, entry));
  }

  auto sinks = sentinel::schema::policy_t::sink_map_t{};
  for (const auto& entry : list_field(document, "sinks", "policy")) {
    if (!entry.is_object()) {
      fail(error_code_t::policy_parse_error, "sinks: entries must be mappings");
    }
    auto id = string_field(entry, "id", "sinks",
                           error_code_t::policy_parse_error);
    if (!id || id->empty()) {
      fail(error_code_t::policy_parse_error, "sinks: missing 'id'");
    }
    if (sinks.contains(*id)) {
      fail(error_code_t::duplicate_id, "duplicate sink id '" + *id + "'");
    }

    const auto where = "sink '" + *id + "'";
    auto sink = sentinel::schema::sink_spec_t{};
    sink.id = *id;
    sink.function =
        string_field(entry, "function", where, error_code_t::policy_parse_error)
            .value_or("");
    sink.required_validator_ids =
        string_list(entry, "require", where, error_code_t::policy_parse_error);
    if (const auto* forbidden = entry.find("forbid_functions");
        forbidden != nullptr && !forbidden->is_null()) {
      fail(error_code_t::policy_parse_error,
           where + ": 'forbid_functions' is not supported");
    }
    if (const auto* on_violation = entry.find("on_violation");
        on_violation != nullptr && !on_violation->is_null()) {
      if (!on_violation->is_object()) {
        fail(error_code_t::policy_parse_error,
             where + ": 'on_violation' must be a mapping");
      }
      if (auto mode = string_field(*on_violation, "mode", where,
                                   error_code_t::policy_parse_error)) {
        sink.mode_override = parse_mode(*mode, where);
      }
      sink.violation_message = string_field(*on_violation, "message", where,
                                            error_code_t::policy_parse_error);
    }
    sinks.emplace(*id, std::move(sink));
  }

  auto policy = std::make_shared<const sentinel::schema::policy_t>(
      default_mode, std::move(validators), std::move(sinks),
      static_cast<uint16_t>(version));
  spdlog::debug("built policy with {} validator(s) and {} sink(s)",
                policy->validators().size(), policy->sinks().size());
  return policy;
}

}  // namespace sentinel::policy
