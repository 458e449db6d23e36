#pragma once

#include <sentinel/schema/enforcement_mode.hpp>
#include <sentinel/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sentinel::schema {

struct sink_spec_t final {
  sink_id_t id;
  std::string function;  // qualified operation name, e.g. "file.write"
  std::vector<validator_id_t> required_validator_ids;  // evaluation order
  std::optional<enforcement_mode_t> mode_override;
  std::optional<std::string> violation_message;
};

}  // namespace sentinel::schema
