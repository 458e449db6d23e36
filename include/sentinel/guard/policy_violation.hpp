#pragma once

#include <sentinel/schema/decision.hpp>
#include <sentinel/schema/primitives.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace sentinel::guard {

/// Raised by sink adapters when a decision blocks the operation. The
/// operation has not been performed.
class policy_violation final : public std::runtime_error {
 public:
  policy_violation(sentinel::schema::sink_id_t sink_id,
                   sentinel::schema::block_t decision,
                   const std::string& message)
      : std::runtime_error{message},
        sink_id_{std::move(sink_id)},
        decision_{std::move(decision)} {}

  const sentinel::schema::sink_id_t& sink_id() const { return sink_id_; }
  const sentinel::schema::block_t& decision() const { return decision_; }

 private:
  sentinel::schema::sink_id_t sink_id_;
  sentinel::schema::block_t decision_;
};

}  // namespace sentinel::guard
