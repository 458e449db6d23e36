#pragma once

#include <sentinel/policy/builder.hpp>
#include <sentinel/schema/policy.hpp>
#include <sentinel/schema/value.hpp>

#include <filesystem>
#include <string_view>

namespace sentinel::policy {

/// Parses YAML (JSON is accepted as a subset) into a structured value.
/// Quoted scalars stay strings; plain scalars become null, booleans,
/// integers or numbers where they read as such.
///
/// Throws common::policy_error (policy_parse_error).
sentinel::schema::value_t parse_document(std::string_view text);
sentinel::schema::value_t load_document(const std::filesystem::path& path);

/// Loads and builds a policy file. `schema_ref` entries resolve relative to
/// the directory holding `path`.
sentinel::schema::policy_ptr_t load_policy_file(
    const std::filesystem::path& path,
    const builder_options_t& options = {});

/// Loads and builds policy text. `schema_ref` entries resolve relative to
/// the working directory.
sentinel::schema::policy_ptr_t load_policy_string(
    std::string_view text,
    const builder_options_t& options = {});

}  // namespace sentinel::policy
