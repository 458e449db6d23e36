#include <sentinel/guard/guarded_command.hpp>

#include <spawn.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>

extern char** environ;

namespace sentinel::guard {

guarded_command::guarded_command(sink_guard guard)
    : guard_{std::move(guard)} {}

command_result_t guarded_command::run(
    const std::vector<std::string>& argv) const {
  if (argv.empty()) {
    throw std::invalid_argument{"guarded_command requires a program name"};
  }

  auto arguments = std::vector<sentinel::schema::value_t>{};
  arguments.reserve(argv.size());
  for (const auto& arg : argv) {
    arguments.emplace_back(arg);
  }
  auto result = command_result_t{};
  result.decision = guard_.enforce(arguments);

  auto raw = std::vector<char*>{};
  raw.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    raw.push_back(const_cast<char*>(arg.c_str()));
  }
  raw.push_back(nullptr);

  pid_t pid{};
  if (auto rc = posix_spawnp(&pid, raw[0], nullptr, nullptr, raw.data(),
                             environ);
      rc != 0) {
    throw std::system_error{rc, std::generic_category(),
                            "cannot spawn '" + argv[0] + "'"};
  }
  spdlog::debug("spawned '{}' as pid {}", argv[0], pid);

  auto status = int{};
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      throw std::system_error{errno, std::generic_category(),
                              "cannot wait for '" + argv[0] + "'"};
    }
  }
  if (WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_status = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace sentinel::guard
