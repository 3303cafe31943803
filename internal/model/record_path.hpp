#pragma once

#include <filesystem>
#include <string>

#include "internal/model/state_machine.hpp"

namespace alerts::model {

/*
  Canonical relative path of a record:

      {bucket}/{active|expired}/{slug}

  Only the author derives it; every other participant carries it around
  as received.
*/
struct RecordPath {
  std::string    bucket;
  LifecycleState state = LifecycleState::kActive;
  std::string    slug;

  std::string ToString() const {
    return bucket + "/" + std::string(model::ToString(state)) + "/" + slug;
  }

  std::filesystem::path Under(const std::filesystem::path& root) const {
    return root / bucket / std::string(model::ToString(state)) / slug;
  }

  RecordPath WithState(LifecycleState next) const {
    RecordPath moved = *this;
    moved.state      = next;
    return moved;
  }

  // State-independent identity; a record keeps it across moves.
  std::string Key() const {
    return bucket + "/" + slug;
  }

  bool operator==(const RecordPath& other) const {
    return bucket == other.bucket && state == other.state && slug == other.slug;
  }

  bool operator!=(const RecordPath& other) const {
    return !(*this == other);
  }

  bool operator<(const RecordPath& other) const {
    return ToString() < other.ToString();
  }
};

} // namespace alerts::model
