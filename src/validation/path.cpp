#include <sentinel/validation/path.hpp>

#include <vector>

namespace sentinel::validation {

namespace {

void push_components(std::string_view path,
                     std::vector<std::string_view>& components) {
  while (!path.empty()) {
    auto slash = path.find('/');
    auto component = path.substr(0, slash);
    path = slash == std::string_view::npos ? std::string_view{}
                                           : path.substr(slash + 1);
    if (component.empty() || component == ".") {
      continue;
    }
    if (component == "..") {
      if (!components.empty()) {
        components.pop_back();
      }
      continue;
    }
    components.push_back(component);
  }
}

}  // namespace

std::string normalize_path(const std::string_view path,
                           const std::string_view base) {
  auto components = std::vector<std::string_view>{};
  if (!path.starts_with('/')) {
    push_components(base, components);
  }
  push_components(path, components);

  if (components.empty()) {
    return "/";
  }
  auto out = std::string{};
  for (const auto& component : components) {
    out.push_back('/');
    out.append(component);
  }
  return out;
}

bool is_within(const std::string_view path, const std::string_view root) {
  if (root == "/") {
    return path.starts_with('/');
  }
  if (!path.starts_with(root)) {
    return false;
  }
  return path.size() == root.size() || path[root.size()] == '/';
}

std::string_view parent_of(const std::string_view path) {
  auto slash = path.rfind('/');
  if (slash == std::string_view::npos || slash == 0) {
    return "/";
  }
  return path.substr(0, slash);
}

}  // namespace sentinel::validation
