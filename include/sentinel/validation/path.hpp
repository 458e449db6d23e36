#pragma once

#include <string>
#include <string_view>

// Lexical path arithmetic. Nothing here touches the filesystem; symbolic
// links are not resolved.
namespace sentinel::validation {

/// Absolute, normalized form of `path`. Relative input is anchored at `base`;
/// `.` and empty components are dropped; `..` pops one component and clamps
/// at the root.
std::string normalize_path(std::string_view path, std::string_view base = "/");

/// True when normalized `root` is a component-wise prefix of normalized
/// `path` ("/srv/up" is not a prefix of "/srv/uploads").
bool is_within(std::string_view path, std::string_view root);

/// Parent directory of a normalized absolute path; "/" is its own parent.
std::string_view parent_of(std::string_view path);

}  // namespace sentinel::validation
