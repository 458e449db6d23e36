#pragma once

#include <sentinel/guard/sink_guard.hpp>

#include <string>
#include <vector>

namespace sentinel::guard {

struct command_result_t final {
  sentinel::schema::decision_t decision;
  int exit_status{};  // 128 + signal number when killed by a signal
};

/// Process execution gated by a sink whose validators see every argv
/// element. No shell is involved; argv[0] is looked up on PATH.
class guarded_command final {
 public:
  explicit guarded_command(sink_guard guard);

  /// Throws policy_violation without spawning when argv is blocked,
  /// std::invalid_argument for an empty argv and std::system_error when the
  /// process cannot be started or waited for.
  command_result_t run(const std::vector<std::string>& argv) const;

 private:
  sink_guard guard_;
};

}  // namespace sentinel::guard
