#pragma once

#include <sentinel/schema/value.hpp>
#include <sentinel/taint/tainted.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sentinel::taint {

struct tainted_node_t;

using tainted_array_t = std::vector<tainted_node_t>;
using tainted_object_t = std::vector<std::pair<std::string, tainted_node_t>>;

/// Mirror of schema::value_t whose string leaves carry tags. Object keys
/// are structural and stay untagged.
struct tainted_node_t final {
  using storage_t = std::variant<sentinel::schema::null_t,
                                 bool,
                                 int64_t,
                                 double,
                                 tainted_string_t,
                                 tainted_array_t,
                                 tainted_object_t>;

  storage_t data;
};

using tainted_tree_t = tainted_node_t;

/// Wraps every string leaf of `value`.
tainted_tree_t tag(const sentinel::schema::value_t& value,
                   const tag_set_t& tags);

/// Adds `tags` to every string leaf.
tainted_tree_t tag(const tainted_tree_t& tree, const tag_set_t& tags);

/// Plain value for validation; shape and order are preserved.
sentinel::schema::value_t strip(const tainted_tree_t& tree);

tag_set_t collect_tags(const tainted_tree_t& tree);

bool has_tag(const tainted_tree_t& tree, std::string_view tag);

}  // namespace sentinel::taint
