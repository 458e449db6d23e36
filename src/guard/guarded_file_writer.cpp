#include <sentinel/guard/guarded_file_writer.hpp>
#include <sentinel/validation/path.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace sentinel::guard {

using sentinel::schema::value_t;

namespace {

// String validators judge the file name; every other kind sees the full
// target path.
execution::argument_view_t file_name_view(const value_t& file_name) {
  return [&file_name](const sentinel::schema::validator_spec_t& spec,
                      const value_t& target) -> const value_t& {
    if (std::holds_alternative<sentinel::schema::string_validator_t>(spec)) {
      return file_name;
    }
    return target;
  };
}

}  // namespace

guarded_file_writer::guarded_file_writer(sink_guard guard)
    : guard_{std::move(guard)} {}

std::string guarded_file_writer::resolve(const std::string_view path) {
  if (path.starts_with('/')) {
    return validation::normalize_path(path);
  }
  return validation::normalize_path(path,
                                    std::filesystem::current_path().string());
}

sentinel::schema::decision_t guarded_file_writer::write(
    const std::string& path,
    const std::string_view content,
    const write_mode_t mode) const {
  const auto target = value_t{resolve(path)};
  const auto& resolved = *target.string_if();
  const auto file_name = value_t{file_name_of(resolved)};
  auto decision = guard_.enforce(std::span<const value_t>{&target, 1}, {},
                                 file_name_view(file_name));
  write_unchecked(resolved, content, mode);
  return decision;
}

sentinel::schema::decision_t guarded_file_writer::write(
    const taint::tainted_string_t& path,
    const std::string_view content,
    taint::flow_trail* trail,
    const write_mode_t mode) const {
  const auto resolved = resolve(path.value());
  const auto file_name = value_t{file_name_of(resolved)};
  auto tree =
      taint::tainted_tree_t{taint::tainted_string_t{resolved, path.tags()}};
  auto decision = guard_.enforce(tree, trail, file_name_view(file_name));
  write_unchecked(resolved, content, mode);
  return decision;
}

std::string guarded_file_writer::file_name_of(const std::string_view resolved) {
  return std::string{resolved.substr(resolved.rfind('/') + 1)};
}

void guarded_file_writer::write_unchecked(const std::string& path,
                                          const std::string_view content,
                                          const write_mode_t mode) const {
  auto flags = std::ios::binary | std::ios::out;
  flags |= mode == write_mode_t::append ? std::ios::app : std::ios::trunc;
  auto out = std::ofstream{path, flags};
  if (!out) {
    throw std::system_error{errno, std::generic_category(),
                            "cannot open '" + path + "' for writing"};
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!out) {
    throw std::system_error{errno, std::generic_category(),
                            "cannot write '" + path + "'"};
  }
  spdlog::debug("wrote {} byte(s) to {}", content.size(), path);
}

}  // namespace sentinel::guard
