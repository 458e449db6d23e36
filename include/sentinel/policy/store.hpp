#pragma once

#include <sentinel/policy/builder.hpp>
#include <sentinel/schema/policy.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sentinel::policy {

/// Current policy for a running process.
///
/// Readers take a snapshot and keep it for the whole request; a reload
/// swaps the pointer and never touches a policy already handed out.
class policy_store final {
 public:
  explicit policy_store(sentinel::schema::policy_ptr_t initial);

  sentinel::schema::policy_ptr_t snapshot() const;

  /// Installs `next`; ignored when null.
  void replace(sentinel::schema::policy_ptr_t next);

  /// Loads `path` and installs it. On failure the current policy stays in
  /// force, `error` holds the reason and false is returned.
  bool reload_from_file(const std::filesystem::path& path,
                        std::string& error,
                        const builder_options_t& options = {});

  /// Incremented on every successful install, starting at 1.
  uint64_t generation() const;

 private:
  std::atomic<sentinel::schema::policy_ptr_t> current_;
  std::atomic<uint64_t> generation_{1};
};

}  // namespace sentinel::policy
