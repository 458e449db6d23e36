#include <sentinel/common/error.hpp>
#include <sentinel/policy/loader.hpp>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <charconv>
#include <limits>
#include <optional>
#include <regex>
#include <string>

namespace sentinel::policy {

using sentinel::common::error_code_t;
using sentinel::common::policy_error;
using sentinel::schema::value_t;

namespace {

inline constexpr auto kTrueSpellings =
    std::array<std::string_view, 3>{"true", "True", "TRUE"};
inline constexpr auto kFalseSpellings =
    std::array<std::string_view, 3>{"false", "False", "FALSE"};
inline constexpr auto kNullSpellings =
    std::array<std::string_view, 4>{"~", "null", "Null", "NULL"};

template <std::size_t N>
bool spelled_as(const std::string_view text,
                const std::array<std::string_view, N>& spellings) {
  for (const auto& s : spellings) {
    if (s == text) {
      return true;
    }
  }
  return false;
}

// Plain scalars that resolve to numbers. Decimal integers take no leading
// zero, so "0123456789" stays a string; .inf and .nan need their dot.
const std::regex kDecimalInteger{R"([-+]?(0|[1-9][0-9]*))"};
const std::regex kHexInteger{R"(0x[0-9a-fA-F]+)"};
const std::regex kOctalInteger{R"(0o[0-7]+)"};
const std::regex kFloat{
    R"([-+]?((\.[0-9]+|[0-9]+\.[0-9]*)([eE][-+]?[0-9]+)?|[0-9]+[eE][-+]?[0-9]+))"};
const std::regex kInfinity{R"([-+]?\.(inf|Inf|INF))"};
const std::regex kNotANumber{R"(\.(nan|NaN|NAN))"};

std::optional<value_t> parse_integer(std::string_view digits, const int base) {
  auto negative = false;
  if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
    negative = digits.front() == '-';
    digits.remove_prefix(1);
  }
  auto magnitude = uint64_t{};
  const auto* last = digits.data() + digits.size();
  auto [end, ec] = std::from_chars(digits.data(), last, magnitude, base);
  if (ec != std::errc{} || end != last) {
    return std::nullopt;
  }
  constexpr auto kMax =
      static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (negative && magnitude == kMax + 1) {
    return value_t{std::numeric_limits<int64_t>::min()};
  }
  if (magnitude > kMax) {
    return std::nullopt;
  }
  const auto signed_value = static_cast<int64_t>(magnitude);
  return value_t{negative ? -signed_value : signed_value};
}

std::optional<value_t> plain_number(const std::string& text) {
  const auto decimal = std::regex_match(text, kDecimalInteger);
  if (decimal) {
    if (auto integer = parse_integer(text, 10)) {
      return integer;
    }
  } else if (std::regex_match(text, kHexInteger)) {
    return parse_integer(std::string_view{text}.substr(2), 16);
  } else if (std::regex_match(text, kOctalInteger)) {
    return parse_integer(std::string_view{text}.substr(2), 8);
  }
  if (std::regex_match(text, kInfinity)) {
    const auto inf = std::numeric_limits<double>::infinity();
    return value_t{text.front() == '-' ? -inf : inf};
  }
  if (std::regex_match(text, kNotANumber)) {
    return value_t{std::numeric_limits<double>::quiet_NaN()};
  }
  // Decimal integers beyond int64_t fall back to double.
  if (decimal || std::regex_match(text, kFloat)) {
    auto digits = std::string_view{text};
    if (digits.front() == '+') {
      digits.remove_prefix(1);
    }
    auto number = double{};
    const auto* last = digits.data() + digits.size();
    if (auto [end, ec] = std::from_chars(digits.data(), last, number);
        ec == std::errc{} && end == last) {
      return value_t{number};
    }
  }
  return std::nullopt;
}

value_t to_scalar(const YAML::Node& node) {
  const auto& text = node.Scalar();
  if (node.Tag() == "!") {
    return value_t{text};  // quoted
  }
  if (spelled_as(text, kNullSpellings)) {
    return value_t{};
  }
  if (spelled_as(text, kTrueSpellings)) {
    return value_t{true};
  }
  if (spelled_as(text, kFalseSpellings)) {
    return value_t{false};
  }

  if (auto number = plain_number(text)) {
    return *number;
  }
  return value_t{text};
}

value_t to_value(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return value_t{};
    case YAML::NodeType::Scalar:
      return to_scalar(node);
    case YAML::NodeType::Sequence: {
      auto out = sentinel::schema::array_t{};
      out.reserve(node.size());
      for (const auto& element : node) {
        out.push_back(to_value(element));
      }
      return value_t{std::move(out)};
    }
    case YAML::NodeType::Map: {
      auto out = sentinel::schema::object_t{};
      out.reserve(node.size());
      for (const auto& member : node) {
        if (!member.first.IsScalar()) {
          throw policy_error{error_code_t::policy_parse_error,
                             "mapping keys must be scalars"};
        }
        out.emplace_back(member.first.Scalar(), to_value(member.second));
      }
      return value_t{std::move(out)};
    }
  }
  return value_t{};
}

sentinel::schema::policy_ptr_t build_logged(const value_t& document,
                                            schema_resolver_t resolver,
                                            const builder_options_t& options,
                                            const std::string_view origin) {
  auto policy =
      policy_builder{std::move(resolver), options}.build(document);
  spdlog::info("loaded policy from {}: {} validator(s), {} sink(s), "
               "fingerprint {}",
               origin, policy->validators().size(), policy->sinks().size(),
               sentinel::schema::to_hex(sentinel::schema::bytes_view_t{
                   policy->fingerprint().data(),
                   policy->fingerprint().size()}));
  return policy;
}

}  // namespace

value_t parse_document(const std::string_view text) {
  try {
    return to_value(YAML::Load(std::string{text}));
  } catch (const YAML::Exception& e) {
    throw policy_error{error_code_t::policy_parse_error,
                       std::string{"malformed document: "} + e.what()};
  }
}

value_t load_document(const std::filesystem::path& path) {
  try {
    return to_value(YAML::LoadFile(path.string()));
  } catch (const YAML::BadFile&) {
    throw policy_error{error_code_t::policy_parse_error,
                       "cannot read '" + path.string() + "'"};
  } catch (const YAML::Exception& e) {
    throw policy_error{error_code_t::policy_parse_error,
                       "malformed document '" + path.string() +
                           "': " + e.what()};
  }
}

sentinel::schema::policy_ptr_t load_policy_file(
    const std::filesystem::path& path,
    const builder_options_t& options) {
  const auto directory = path.parent_path();
  auto resolver = [directory](std::string_view ref) {
    auto target = std::filesystem::path{ref};
    if (target.is_relative()) {
      target = directory / target;
    }
    return load_document(target);
  };
  return build_logged(load_document(path), std::move(resolver), options,
                      path.string());
}

sentinel::schema::policy_ptr_t load_policy_string(
    const std::string_view text,
    const builder_options_t& options) {
  auto resolver = [](std::string_view ref) {
    return load_document(std::filesystem::path{ref});
  };
  return build_logged(parse_document(text), std::move(resolver), options,
                      "<string>");
}

}  // namespace sentinel::policy
