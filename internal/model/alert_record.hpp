#pragma once

#include <string>
#include <utility>
#include <vector>

#include "internal/model/coordinates.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace alerts::model {

// Ordered key/value metadata; written as "--> key: value" lines.
using Metadata = std::vector<std::pair<std::string, std::string>>;

struct AlertRecord {
  std::string title;
  std::string body;

  // UTC, second precision.
  alerts::util::TimePoint created_at{};
  Coordinates             coordinates;

  // Author callsign.
  std::string author;

  LifecycleState state = LifecycleState::kActive;

  // Opaque; produced and checked outside this core.
  std::string signature;

  Metadata metadata;
};

struct Comment {
  alerts::util::TimePoint created_at{};
  std::string             author;
  std::string             body;
  std::string             signature;
  Metadata                metadata;
};

} // namespace alerts::model
