#pragma once

#include <csignal>
#include <exception>
#include <memory>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace sentinel::common {

/// Process-level fault with no recovery path (storage corruption, broken
/// invariants in persisted state). Flushes every logger before terminating so
/// the last audit lines reach disk.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
    logger->flush();
  });
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace sentinel::common
