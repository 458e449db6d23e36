#include <sentinel/common/error.hpp>
#include <sentinel/validation/regex_guard.hpp>

#include <cctype>
#include <vector>

namespace sentinel::validation {

namespace {

[[noreturn]] void reject(const std::string_view context,
                         const std::string_view source,
                         const std::string_view why) {
  throw common::policy_error{
      common::error_code_t::invalid_validator_spec,
      std::string{context} + ": pattern '" + std::string{source} + "' " +
          std::string{why}};
}

bool is_repeat(const char c) {
  return c == '+' || c == '*' || c == '{';
}

// Index just past the closing ']' of a class starting at `open`.
std::size_t skip_class(const std::string_view source, std::size_t open) {
  auto i = open + 1;
  if (i < source.size() && source[i] == '^') {
    ++i;
  }
  if (i < source.size() && source[i] == ']') {
    ++i;
  }
  while (i < source.size() && source[i] != ']') {
    i += source[i] == '\\' ? 2 : 1;
  }
  return i + 1;
}

void check_shape(const std::string_view source,
                 const std::string_view context) {
  // One flag per open group: whether something inside it repeats.
  auto groups = std::vector<bool>{};
  auto closed_repeating_group = false;

  for (auto i = std::size_t{0}; i < source.size();) {
    const auto c = source[i];
    if (c == '\\') {
      if (i + 1 < source.size() && source[i + 1] >= '1' &&
          source[i + 1] <= '9') {
        reject(context, source, "uses a backreference");
      }
      closed_repeating_group = false;
      i += 2;
      continue;
    }
    if (c == '[') {
      closed_repeating_group = false;
      i = skip_class(source, i);
      continue;
    }
    if (c == '(') {
      groups.push_back(false);
      closed_repeating_group = false;
      ++i;
      if (i < source.size() && source[i] == '?') {
        ++i;  // group modifier, not a quantifier
      }
      continue;
    }
    if (c == ')') {
      if (groups.empty()) {
        reject(context, source, "has an unbalanced ')'");
      }
      closed_repeating_group = groups.back();
      groups.pop_back();
      if (closed_repeating_group && !groups.empty()) {
        groups.back() = true;
      }
      ++i;
      continue;
    }
    if (is_repeat(c)) {
      if (closed_repeating_group) {
        reject(context, source, "nests quantifiers");
      }
      if (!groups.empty()) {
        groups.back() = true;
      }
    }
    closed_repeating_group = false;
    ++i;
  }
}

}  // namespace

sentinel::schema::pattern_t compile_pattern(const std::string_view source,
                                            const std::string_view context) {
  if (source.size() > kMaxPatternLength) {
    reject(context, source.substr(0, 32), "exceeds the maximum length");
  }
  check_shape(source, context);
  try {
    return {std::string{source},
            std::regex{std::string{source}, std::regex::ECMAScript}};
  } catch (const std::regex_error& e) {
    reject(context, source, std::string{"does not compile: "} + e.what());
  }
}

sentinel::schema::charset_t compile_charset(const std::string_view source,
                                            const std::string_view context) {
  auto out = sentinel::schema::charset_t{std::string{source}, {}};

  // Expand escapes first so ranges see literal bytes.
  auto literal = std::vector<std::pair<char, bool>>{};  // byte, escaped
  for (auto i = std::size_t{0}; i < source.size(); ++i) {
    if (source[i] != '\\') {
      literal.emplace_back(source[i], false);
      continue;
    }
    if (i + 1 == source.size()) {
      throw common::policy_error{
          common::error_code_t::invalid_validator_spec,
          std::string{context} + ": charset ends with a lone backslash"};
    }
    const auto next = source[++i];
    switch (next) {
      case 'n':
        literal.emplace_back('\n', true);
        break;
      case 't':
        literal.emplace_back('\t', true);
        break;
      case 's':
        for (const auto ws : std::string_view{" \t\n\r\f\v"}) {
          literal.emplace_back(ws, true);
        }
        break;
      case 'd':
        for (auto d = '0'; d <= '9'; ++d) {
          literal.emplace_back(d, true);
        }
        break;
      case 'w':
        for (auto b = 0; b < 256; ++b) {
          if (std::isalnum(b) != 0 || b == '_') {
            literal.emplace_back(static_cast<char>(b), true);
          }
        }
        break;
      default:
        literal.emplace_back(next, true);
        break;
    }
  }

  for (auto i = std::size_t{0}; i < literal.size(); ++i) {
    const auto [c, escaped] = literal[i];
    const auto is_range = !escaped && i > 0 && i + 1 < literal.size() &&
                          c == '-';
    if (!is_range) {
      out.allowed.set(static_cast<uint8_t>(c));
      continue;
    }
    const auto low = static_cast<uint8_t>(literal[i - 1].first);
    const auto high = static_cast<uint8_t>(literal[i + 1].first);
    if (low > high) {
      throw common::policy_error{
          common::error_code_t::invalid_validator_spec,
          std::string{context} + ": charset range out of order in '" +
              std::string{source} + "'"};
    }
    for (auto b = static_cast<int>(low); b <= high; ++b) {
      out.allowed.set(static_cast<std::size_t>(b));
    }
    ++i;  // the range end is already set
    out.allowed.set(high);
  }
  return out;
}

}  // namespace sentinel::validation
