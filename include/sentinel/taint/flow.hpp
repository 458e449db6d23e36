#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sentinel::taint {

inline constexpr auto kRequestOrigin = std::string_view{"http_request"};

/// Ordered provenance points for one request, e.g. http_request ->
/// middleware:json_parsing -> file_write. Owned by the request; not shared
/// across threads.
class flow_trail final {
 public:
  flow_trail() = default;
  explicit flow_trail(std::string_view origin);

  /// Appends `point` unless it equals the most recent one.
  void record(std::string_view point);

  const std::vector<std::string>& points() const { return points_; }
  bool empty() const { return points_.empty(); }

  /// "a -> b -> c"
  std::string to_string() const;

 private:
  std::vector<std::string> points_;
};

}  // namespace sentinel::taint
