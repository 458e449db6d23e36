#include <sentinel/schema/primitives.hpp>
#include <sentinel/taint/tree.hpp>

namespace sentinel::taint {

using sentinel::schema::array_t;
using sentinel::schema::null_t;
using sentinel::schema::object_t;
using sentinel::schema::value_t;

tainted_tree_t tag(const value_t& value, const tag_set_t& tags) {
  return std::visit(
      overloaded{
          [&](const std::string& s) {
            return tainted_tree_t{tainted_string_t{s, tags}};
          },
          [&](const array_t& elements) {
            auto out = tainted_array_t{};
            out.reserve(elements.size());
            for (const auto& element : elements) {
              out.push_back(tag(element, tags));
            }
            return tainted_tree_t{std::move(out)};
          },
          [&](const object_t& members) {
            auto out = tainted_object_t{};
            out.reserve(members.size());
            for (const auto& [key, member] : members) {
              out.emplace_back(key, tag(member, tags));
            }
            return tainted_tree_t{std::move(out)};
          },
          [](const auto& scalar) { return tainted_tree_t{scalar}; }},
      value.data);
}

tainted_tree_t tag(const tainted_tree_t& tree, const tag_set_t& tags) {
  return std::visit(
      overloaded{
          [&](const tainted_string_t& s) {
            return tainted_tree_t{tag(s, tags)};
          },
          [&](const tainted_array_t& elements) {
            auto out = tainted_array_t{};
            out.reserve(elements.size());
            for (const auto& element : elements) {
              out.push_back(tag(element, tags));
            }
            return tainted_tree_t{std::move(out)};
          },
          [&](const tainted_object_t& members) {
            auto out = tainted_object_t{};
            out.reserve(members.size());
            for (const auto& [key, member] : members) {
              out.emplace_back(key, tag(member, tags));
            }
            return tainted_tree_t{std::move(out)};
          },
          [](const auto& scalar) { return tainted_tree_t{scalar}; }},
      tree.data);
}

value_t strip(const tainted_tree_t& tree) {
  return std::visit(
      overloaded{[](const tainted_string_t& s) { return value_t{s.value()}; },
                 [](const tainted_array_t& elements) {
                   auto out = array_t{};
                   out.reserve(elements.size());
                   for (const auto& element : elements) {
                     out.push_back(strip(element));
                   }
                   return value_t{std::move(out)};
                 },
                 [](const tainted_object_t& members) {
                   auto out = object_t{};
                   out.reserve(members.size());
                   for (const auto& [key, member] : members) {
                     out.emplace_back(key, strip(member));
                   }
                   return value_t{std::move(out)};
                 },
                 [](const null_t&) { return value_t{}; },
                 [](const auto& scalar) { return value_t{scalar}; }},
      tree.data);
}

namespace {

void collect_into(const tainted_tree_t& tree, tag_set_t& out) {
  if (const auto* s = std::get_if<tainted_string_t>(&tree.data)) {
    out.insert(std::begin(s->tags()), std::end(s->tags()));
  } else if (const auto* elements = std::get_if<tainted_array_t>(&tree.data)) {
    for (const auto& element : *elements) {
      collect_into(element, out);
    }
  } else if (const auto* members = std::get_if<tainted_object_t>(&tree.data)) {
    for (const auto& member : *members) {
      collect_into(member.second, out);
    }
  }
}

}  // namespace

tag_set_t collect_tags(const tainted_tree_t& tree) {
  auto out = tag_set_t{};
  collect_into(tree, out);
  return out;
}

bool has_tag(const tainted_tree_t& tree, const std::string_view tag) {
  return collect_tags(tree).contains(tag);
}

}  // namespace sentinel::taint
