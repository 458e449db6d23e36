#pragma once

#include <sentinel/guard/sink_guard.hpp>
#include <sentinel/taint/flow.hpp>
#include <sentinel/taint/tainted.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace sentinel::guard {

enum class write_mode_t : uint8_t { truncate = 0, append = 1 };

/// File writes gated by a sink.
///
/// The target is resolved lexically (relative input against the working
/// directory) and that resolved path is both validated and opened. String
/// validators see its file name; path and schema validators see the whole
/// path.
class guarded_file_writer final {
 public:
  explicit guarded_file_writer(sink_guard guard);

  /// Absolute, normalized form of `path` as the writer will open it.
  static std::string resolve(std::string_view path);

  /// Last component of a resolved path.
  static std::string file_name_of(std::string_view resolved);

  /// Throws policy_violation before touching the filesystem when the path is
  /// blocked, and std::system_error when the file cannot be written.
  sentinel::schema::decision_t write(
      const std::string& path,
      std::string_view content,
      write_mode_t mode = write_mode_t::truncate) const;

  sentinel::schema::decision_t write(
      const taint::tainted_string_t& path,
      std::string_view content,
      taint::flow_trail* trail = nullptr,
      write_mode_t mode = write_mode_t::truncate) const;

 private:
  sink_guard guard_;

  void write_unchecked(const std::string& path,
                       std::string_view content,
                       write_mode_t mode) const;
};

}  // namespace sentinel::guard
