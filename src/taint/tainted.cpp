#include <sentinel/taint/tainted.hpp>

namespace sentinel::taint {

tag_set_t merge(const tag_set_t& a, const tag_set_t& b) {
  auto out = a;
  out.insert(std::begin(b), std::end(b));
  return out;
}

tainted_string_t tag(std::string value, tag_set_t tags) {
  return {std::move(value), std::move(tags)};
}

tainted_string_t tag(const char* value, tag_set_t tags) {
  return {std::string{value}, std::move(tags)};
}

tainted_string_t tag(const tainted_string_t& value, const tag_set_t& tags) {
  return {value.value(), merge(value.tags(), tags)};
}

tainted_string_t concat(const tainted_string_t& a, const tainted_string_t& b) {
  return join(a, b, [](const std::string& x, const std::string& y) {
    return x + y;
  });
}

tainted_string_t concat(const tainted_string_t& a, const std::string_view b) {
  return {a.value() + std::string{b}, a.tags()};
}

tainted_string_t concat(const std::string_view a, const tainted_string_t& b) {
  return {std::string{a} + b.value(), b.tags()};
}

tainted_string_t substitute(const tainted_string_t& format,
                            const substitutions_t& arguments) {
  const auto& text = format.value();
  auto out = std::string{};
  auto tags = format.tags();
  for (const auto& [name, argument] : arguments) {
    tags.insert(std::begin(argument.tags()), std::end(argument.tags()));
  }

  for (auto i = std::size_t{0}; i < text.size(); ++i) {
    const auto c = text[i];
    if ((c == '{' || c == '}') && i + 1 < text.size() && text[i + 1] == c) {
      out.push_back(c);
      ++i;
      continue;
    }
    if (c != '{') {
      out.push_back(c);
      continue;
    }
    const auto close = text.find('}', i + 1);
    if (close == std::string::npos) {
      out.append(text, i, std::string::npos);
      break;
    }
    const auto name = std::string_view{text}.substr(i + 1, close - i - 1);
    auto it = arguments.find(name);
    if (it == std::end(arguments)) {
      out.append(text, i, close - i + 1);
    } else {
      out.append(it->second.value());
    }
    i = close;
  }
  return {std::move(out), std::move(tags)};
}

tainted_string_t substitute(const std::string_view format,
                            const substitutions_t& arguments) {
  return substitute(tainted_string_t{std::string{format}, {}}, arguments);
}

}  // namespace sentinel::taint
