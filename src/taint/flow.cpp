#include <sentinel/taint/flow.hpp>

namespace sentinel::taint {

flow_trail::flow_trail(const std::string_view origin) {
  record(origin);
}

void flow_trail::record(const std::string_view point) {
  if (!points_.empty() && points_.back() == point) {
    return;
  }
  points_.emplace_back(point);
}

std::string flow_trail::to_string() const {
  auto out = std::string{};
  for (const auto& point : points_) {
    if (!out.empty()) {
      out += " -> ";
    }
    out += point;
  }
  return out;
}

}  // namespace sentinel::taint
