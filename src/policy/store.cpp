#include <sentinel/common/critical.hpp>
#include <sentinel/common/error.hpp>
#include <sentinel/policy/loader.hpp>
#include <sentinel/policy/store.hpp>

#include <spdlog/spdlog.h>

namespace sentinel::policy {

policy_store::policy_store(sentinel::schema::policy_ptr_t initial)
    : current_{std::move(initial)} {
  if (!current_.load()) {
    sentinel::common::critical("policy store created without a policy");
  }
}

sentinel::schema::policy_ptr_t policy_store::snapshot() const {
  return current_.load(std::memory_order_acquire);
}

void policy_store::replace(sentinel::schema::policy_ptr_t next) {
  if (!next) {
    spdlog::warn("ignoring replacement with an empty policy");
    return;
  }
  current_.store(std::move(next), std::memory_order_release);
  generation_.fetch_add(1, std::memory_order_acq_rel);
}

bool policy_store::reload_from_file(const std::filesystem::path& path,
                                    std::string& error,
                                    const builder_options_t& options) {
  try {
    replace(load_policy_file(path, options));
  } catch (const sentinel::common::policy_error& e) {
    error = e.what();
    spdlog::error("policy reload from {} failed, keeping generation {}: {}",
                  path.string(), generation(), error);
    return false;
  }
  spdlog::info("policy reloaded from {} (generation {})", path.string(),
               generation());
  return true;
}

uint64_t policy_store::generation() const {
  return generation_.load(std::memory_order_acquire);
}

}  // namespace sentinel::policy
