#pragma once

#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Advisory provenance labels. Taint never changes a decision; it is carried
// alongside values and reported with audit events.
namespace sentinel::taint {

using tag_t = std::string;
using tag_set_t = std::set<tag_t, std::less<>>;

/// Immutable value plus the set of sources it was derived from.
template <typename T>
class tainted final {
 public:
  tainted(T value, tag_set_t tags)
      : value_{std::move(value)}, tags_{std::move(tags)} {}

  const T& value() const { return value_; }
  const tag_set_t& tags() const { return tags_; }

  bool has_tag(const std::string_view tag) const {
    return tags_.find(tag) != std::end(tags_);
  }

  bool operator==(const tainted&) const = default;

 private:
  T value_;
  tag_set_t tags_;
};

using tainted_string_t = tainted<std::string>;

tag_set_t merge(const tag_set_t& a, const tag_set_t& b);

tainted_string_t tag(std::string value, tag_set_t tags);
tainted_string_t tag(const char* value, tag_set_t tags);

/// Re-tagging adds to the existing set; tags are never removed.
tainted_string_t tag(const tainted_string_t& value, const tag_set_t& tags);

/// Composes two tainted values with `combine`; the result carries the union
/// of both tag sets.
template <typename T, typename U, typename Combine>
auto join(const tainted<T>& a, const tainted<U>& b, Combine&& combine)
    -> tainted<std::invoke_result_t<Combine, const T&, const U&>> {
  return {std::invoke(std::forward<Combine>(combine), a.value(), b.value()),
          merge(a.tags(), b.tags())};
}

tainted_string_t concat(const tainted_string_t& a, const tainted_string_t& b);

/// A plain operand contributes no tags.
tainted_string_t concat(const tainted_string_t& a, std::string_view b);
tainted_string_t concat(std::string_view a, const tainted_string_t& b);

using substitutions_t = std::map<std::string, tainted_string_t, std::less<>>;

/// Replaces "{name}" placeholders with the named arguments. "{{" and "}}"
/// produce literal braces; unknown names are left verbatim. The result
/// carries the template's tags plus the tags of every argument supplied.
tainted_string_t substitute(const tainted_string_t& format,
                            const substitutions_t& arguments);
tainted_string_t substitute(std::string_view format,
                            const substitutions_t& arguments);

}  // namespace sentinel::taint
