#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/value.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace sentinel::schema {

namespace {

void append_json(const value_t& value, std::string& out) {
  std::visit(
      overloaded{
          [&](const null_t&) { out.append("null"); },
          [&](const bool b) { out.append(b ? "true" : "false"); },
          [&](const int64_t i) { out.append(fmt::format("{}", i)); },
          [&](const double d) {
            if (!std::isfinite(d)) {
              out.append("null");
              return;
            }
            out.append(fmt::format("{}", d));
          },
          [&](const std::string& s) { out.append(quote_json(s)); },
          [&](const array_t& a) {
            out.push_back('[');
            for (std::size_t i = 0; i < a.size(); ++i) {
              if (i != 0) {
                out.push_back(',');
              }
              append_json(a[i], out);
            }
            out.push_back(']');
          },
          [&](const object_t& o) {
            out.push_back('{');
            for (std::size_t i = 0; i < o.size(); ++i) {
              if (i != 0) {
                out.push_back(',');
              }
              out.append(quote_json(o[i].first));
              out.push_back(':');
              append_json(o[i].second, out);
            }
            out.push_back('}');
          }},
      value.data);
}

}  // namespace

double value_t::as_double() const noexcept {
  if (const auto* i = std::get_if<int64_t>(&data)) {
    return static_cast<double>(*i);
  }
  if (const auto* d = std::get_if<double>(&data)) {
    return *d;
  }
  return 0.0;
}

const value_t* value_t::find(const std::string_view key) const noexcept {
  const auto* object = object_if();
  if (object == nullptr) {
    return nullptr;
  }
  auto it = std::find_if(std::begin(*object), std::end(*object),
                         [&](const member_t& m) { return m.first == key; });
  if (it == std::end(*object)) {
    return nullptr;
  }
  return &it->second;
}

bool value_t::operator==(const value_t& other) const {
  // 1 and 1.0 compare equal, as they do in JSON.
  if (is_numeric() && other.is_numeric()) {
    if (kind() == value_kind_t::integer &&
        other.kind() == value_kind_t::integer) {
      return std::get<int64_t>(data) == std::get<int64_t>(other.data);
    }
    return as_double() == other.as_double();
  }
  if (kind() != other.kind()) {
    return false;
  }
  switch (kind()) {
    case value_kind_t::null:
      return true;
    case value_kind_t::boolean:
      return std::get<bool>(data) == std::get<bool>(other.data);
    case value_kind_t::string:
      return std::get<std::string>(data) == std::get<std::string>(other.data);
    case value_kind_t::array:
      return std::get<array_t>(data) == std::get<array_t>(other.data);
    case value_kind_t::object: {
      const auto& lhs = std::get<object_t>(data);
      const auto& rhs = std::get<object_t>(other.data);
      if (lhs.size() != rhs.size()) {
        return false;
      }
      // Member order is not part of equality.
      return std::all_of(std::begin(lhs), std::end(lhs), [&](const member_t& m) {
        const auto* found = other.find(m.first);
        return found != nullptr && *found == m.second;
      });
    }
    default:
      return false;
  }
}

std::string_view to_string(const value_kind_t kind) {
  switch (kind) {
    case value_kind_t::null:
      return "null";
    case value_kind_t::boolean:
      return "boolean";
    case value_kind_t::integer:
      return "integer";
    case value_kind_t::number:
      return "number";
    case value_kind_t::string:
      return "string";
    case value_kind_t::array:
      return "array";
    case value_kind_t::object:
      return "object";
  }
  return "unknown";
}

std::string to_json(const value_t& value) {
  auto out = std::string{};
  append_json(value, out);
  return out;
}

std::string quote_json(const std::string_view text) {
  auto out = std::string{};
  out.reserve(text.size() + 2);
  out.push_back('"');
  for (const auto c : text) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      default:
        if (static_cast<uint8_t>(c) < 0x20u) {
          out.append(fmt::format("\\u{:04x}", static_cast<unsigned>(c)));
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  out.push_back('"');
  return out;
}

}  // namespace sentinel::schema
