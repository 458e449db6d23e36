#include <sentinel/common/error.hpp>
#include <sentinel/schema/enum_string.hpp>
#include <sentinel/validation/regex_guard.hpp>
#include <sentinel/validation/schema_validator.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>

namespace sentinel::validation {

using sentinel::schema::array_t;
using sentinel::schema::object_t;
using sentinel::schema::reason_code_t;
using sentinel::schema::schema_node_t;
using sentinel::schema::value_kind_t;
using sentinel::schema::value_t;

namespace {

inline constexpr auto kTypeNameMappings = std::array{
    std::pair<std::string_view, value_kind_t>{"null", value_kind_t::null},
    std::pair<std::string_view, value_kind_t>{"boolean",
                                              value_kind_t::boolean},
    std::pair<std::string_view, value_kind_t>{"integer",
                                              value_kind_t::integer},
    std::pair<std::string_view, value_kind_t>{"number", value_kind_t::number},
    std::pair<std::string_view, value_kind_t>{"string", value_kind_t::string},
    std::pair<std::string_view, value_kind_t>{"array", value_kind_t::array},
    std::pair<std::string_view, value_kind_t>{"object", value_kind_t::object}};

[[noreturn]] void invalid(const std::string& where, const std::string& what) {
  throw common::policy_error{common::error_code_t::invalid_validator_spec,
                             where + ": " + what};
}

value_kind_t parse_type(const value_t& name, const std::string& where) {
  const auto* text = name.string_if();
  if (text == nullptr) {
    invalid(where, "'type' entries must be strings");
  }
  auto kind = sentinel::schema::from_string(*text, kTypeNameMappings);
  if (!kind) {
    invalid(where, "unknown type '" + *text + "', expected one of " +
                       sentinel::schema::joined_names(kTypeNameMappings));
  }
  return *kind;
}

double parse_number(const value_t& v,
                    const std::string& where,
                    std::string_view keyword) {
  if (!v.is_numeric()) {
    invalid(where, "'" + std::string{keyword} + "' must be a number");
  }
  return v.as_double();
}

std::size_t parse_count(const value_t& v,
                        const std::string& where,
                        std::string_view keyword) {
  const auto* count = std::get_if<int64_t>(&v.data);
  if (count == nullptr || *count < 0) {
    invalid(where,
            "'" + std::string{keyword} + "' must be a non-negative integer");
  }
  return static_cast<std::size_t>(*count);
}

// Keywords that carry no assertion. Anything else the compiler does not know
// is rejected so that a schema is never applied partially.
inline constexpr auto kAnnotationKeywords = std::array<std::string_view, 7>{
    "$schema", "$id", "$comment", "title", "description", "default",
    "examples"};

bool is_annotation(const std::string_view keyword) {
  return std::find(std::begin(kAnnotationKeywords),
                   std::end(kAnnotationKeywords),
                   keyword) != std::end(kAnnotationKeywords);
}

std::string escape_pointer_token(std::string_view token) {
  auto out = std::string{};
  for (const auto c : token) {
    if (c == '~') {
      out += "~0";
    } else if (c == '/') {
      out += "~1";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

schema_node_t compile_node(const value_t& document, const std::string& where);

std::vector<schema_node_t> compile_branches(const value_t& v,
                                            const std::string& where,
                                            std::string_view keyword) {
  const auto* list = v.array_if();
  if (list == nullptr || list->empty()) {
    invalid(where, "'" + std::string{keyword} +
                       "' must be a non-empty list of schemas");
  }
  auto out = std::vector<schema_node_t>{};
  out.reserve(list->size());
  for (std::size_t i = 0; i < list->size(); ++i) {
    out.push_back(compile_node((*list)[i], where + "/" + std::to_string(i)));
  }
  return out;
}

schema_node_t compile_node(const value_t& document, const std::string& where) {
  const auto* members = document.object_if();
  if (members == nullptr) {
    invalid(where, "schema must be an object");
  }

  auto node = schema_node_t{};
  for (const auto& [keyword, v] : *members) {
    const auto here = where + "/" + escape_pointer_token(keyword);
    if (keyword == "type") {
      if (const auto* list = v.array_if()) {
        for (const auto& name : *list) {
          node.types.push_back(parse_type(name, here));
        }
      } else {
        node.types.push_back(parse_type(v, here));
      }
    } else if (keyword == "required") {
      const auto* list = v.array_if();
      if (list == nullptr) {
        invalid(here, "'required' must be a list of strings");
      }
      for (const auto& name : *list) {
        const auto* text = name.string_if();
        if (text == nullptr) {
          invalid(here, "'required' must be a list of strings");
        }
        node.required.push_back(*text);
      }
    } else if (keyword == "properties") {
      const auto* properties = v.object_if();
      if (properties == nullptr) {
        invalid(here, "'properties' must be an object");
      }
      for (const auto& [name, child] : *properties) {
        node.properties.emplace_back(
            name, compile_node(child, here + "/" + escape_pointer_token(name)));
      }
    } else if (keyword == "additionalProperties") {
      const auto* flag = v.bool_if();
      if (flag == nullptr) {
        invalid(here, "only boolean 'additionalProperties' is supported");
      }
      node.additional_properties = *flag;
    } else if (keyword == "items") {
      node.items = std::make_shared<const schema_node_t>(compile_node(v, here));
    } else if (keyword == "pattern") {
      const auto* text = v.string_if();
      if (text == nullptr) {
        invalid(here, "'pattern' must be a string");
      }
      node.pattern = compile_pattern(*text, here);
    } else if (keyword == "enum") {
      const auto* list = v.array_if();
      if (list == nullptr) {
        invalid(here, "'enum' must be a list");
      }
      node.enum_values = *list;
    } else if (keyword == "minimum") {
      node.minimum = parse_number(v, here, keyword);
    } else if (keyword == "maximum") {
      node.maximum = parse_number(v, here, keyword);
    } else if (keyword == "exclusiveMinimum") {
      node.exclusive_minimum = parse_number(v, here, keyword);
    } else if (keyword == "exclusiveMaximum") {
      node.exclusive_maximum = parse_number(v, here, keyword);
    } else if (keyword == "minLength") {
      node.min_length = parse_count(v, here, keyword);
    } else if (keyword == "maxLength") {
      node.max_length = parse_count(v, here, keyword);
    } else if (keyword == "minItems") {
      node.min_items = parse_count(v, here, keyword);
    } else if (keyword == "maxItems") {
      node.max_items = parse_count(v, here, keyword);
    } else if (keyword == "const") {
      node.const_value = v;
    } else if (keyword == "allOf") {
      node.all_of = compile_branches(v, here, keyword);
    } else if (keyword == "anyOf") {
      node.any_of = compile_branches(v, here, keyword);
    } else if (keyword == "oneOf") {
      node.one_of = compile_branches(v, here, keyword);
    } else if (keyword == "not") {
      node.negated = std::make_shared<const schema_node_t>(compile_node(v, here));
    } else if (!is_annotation(keyword)) {
      invalid(here, "unsupported keyword '" + keyword + "'");
    }
  }
  return node;
}

bool is_integral(const value_t& v) {
  if (v.kind() == value_kind_t::integer) {
    return true;
  }
  const auto* d = std::get_if<double>(&v.data);
  return d != nullptr && std::isfinite(*d) && std::trunc(*d) == *d;
}

bool matches_type(const value_kind_t expected, const value_t& v) {
  switch (expected) {
    case value_kind_t::integer:
      return is_integral(v);
    case value_kind_t::number:
      return v.is_numeric();
    default:
      return v.kind() == expected;
  }
}

class walker final {
 public:
  walker() = default;
  explicit walker(std::string pointer) : pointer_{std::move(pointer)} {}

  std::optional<std::string> visit(const schema_node_t& node,
                                   const value_t& v) {
    if (!node.types.empty() &&
        std::none_of(std::begin(node.types), std::end(node.types),
                     [&](value_kind_t t) { return matches_type(t, v); })) {
      return violation("type");
    }

    if (node.enum_values &&
        std::find(std::begin(*node.enum_values), std::end(*node.enum_values),
                  v) == std::end(*node.enum_values)) {
      return violation("enum");
    }

    if (node.const_value && v != *node.const_value) {
      return violation("const");
    }

    if (v.is_numeric()) {
      const auto n = v.as_double();
      if (node.minimum && n < *node.minimum) {
        return violation("minimum");
      }
      if (node.maximum && n > *node.maximum) {
        return violation("maximum");
      }
      if (node.exclusive_minimum && n <= *node.exclusive_minimum) {
        return violation("exclusiveMinimum");
      }
      if (node.exclusive_maximum && n >= *node.exclusive_maximum) {
        return violation("exclusiveMaximum");
      }
    }

    if (const auto* text = v.string_if()) {
      const auto length = sentinel::schema::utf8_length(*text);
      if (node.min_length && length < *node.min_length) {
        return violation("minLength");
      }
      if (node.max_length && length > *node.max_length) {
        return violation("maxLength");
      }
      if (node.pattern) {
        try {
          if (!std::regex_search(*text, node.pattern->compiled)) {
            return violation("pattern");
          }
        } catch (const std::regex_error&) {
          return violation("pattern");
        }
      }
    }

    if (auto failure = visit_branches(node, v)) {
      return failure;
    }

    if (const auto* members = v.object_if()) {
      return visit_object(node, v, *members);
    }
    if (const auto* elements = v.array_if()) {
      return visit_array(node, *elements);
    }
    return std::nullopt;
  }

 private:
  std::string pointer_;

  std::string violation(std::string_view keyword) const {
    return fmt::format("{}: {}", pointer_.empty() ? "/" : pointer_, keyword);
  }

  std::optional<std::string> descend(std::string_view token,
                                     const schema_node_t& node,
                                     const value_t& v) {
    const auto saved = pointer_.size();
    pointer_ += "/";
    pointer_ += escape_pointer_token(token);
    auto result = visit(node, v);
    pointer_.resize(saved);
    return result;
  }

  bool conforms(const schema_node_t& node, const value_t& v) const {
    return !walker{pointer_}.visit(node, v).has_value();
  }

  // allOf reports the failing branch's own detail; the others only know that
  // the combination did not hold.
  std::optional<std::string> visit_branches(const schema_node_t& node,
                                            const value_t& v) {
    for (const auto& branch : node.all_of) {
      if (auto failure = visit(branch, v)) {
        return failure;
      }
    }
    if (!node.any_of.empty() &&
        std::none_of(std::begin(node.any_of), std::end(node.any_of),
                     [&](const auto& branch) { return conforms(branch, v); })) {
      return violation("anyOf");
    }
    if (!node.one_of.empty() &&
        std::count_if(std::begin(node.one_of), std::end(node.one_of),
                      [&](const auto& branch) {
                        return conforms(branch, v);
                      }) != 1) {
      return violation("oneOf");
    }
    if (node.negated && conforms(*node.negated, v)) {
      return violation("not");
    }
    return std::nullopt;
  }

  std::optional<std::string> visit_object(const schema_node_t& node,
                                          const value_t& v,
                                          const object_t& members) {
    for (const auto& name : node.required) {
      if (v.find(name) == nullptr) {
        return fmt::format("{}: required '{}'",
                           pointer_.empty() ? "/" : pointer_, name);
      }
    }
    for (const auto& [name, child] : node.properties) {
      if (const auto* member = v.find(name)) {
        if (auto failure = descend(name, child, *member)) {
          return failure;
        }
      }
    }
    if (node.additional_properties.value_or(true)) {
      return std::nullopt;
    }
    for (const auto& member : members) {
      auto declared =
          std::any_of(std::begin(node.properties), std::end(node.properties),
                      [&](const auto& p) {
                        return p.first == member.first;
                      });
      if (!declared) {
        const auto saved = pointer_.size();
        pointer_ += "/" + escape_pointer_token(member.first);
        auto failure = violation("additionalProperties");
        pointer_.resize(saved);
        return failure;
      }
    }
    return std::nullopt;
  }

  std::optional<std::string> visit_array(const schema_node_t& node,
                                         const array_t& elements) {
    if (node.min_items && elements.size() < *node.min_items) {
      return violation("minItems");
    }
    if (node.max_items && elements.size() > *node.max_items) {
      return violation("maxItems");
    }
    if (!node.items) {
      return std::nullopt;
    }
    for (auto i = std::size_t{0}; i < elements.size(); ++i) {
      if (auto failure = descend(std::to_string(i), *node.items, elements[i])) {
        return failure;
      }
    }
    return std::nullopt;
  }
};

}  // namespace

schema_node_t compile_schema(const value_t& document,
                             const std::string_view context) {
  return compile_node(document, std::string{context});
}

validation_result_t evaluate(const sentinel::schema::schema_validator_t& spec,
                             const value_t& instance) {
  auto w = walker{};
  if (auto failure = w.visit(spec.root, instance)) {
    return validation_result_t::fail(reason_code_t::schema_violation,
                                     std::move(*failure));
  }
  return validation_result_t::pass();
}

}  // namespace sentinel::validation
