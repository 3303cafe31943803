#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace alerts::model {

enum class LifecycleState : std::uint8_t {
  kActive  = 0,
  kExpired = 1,
};

constexpr bool IsTerminal(LifecycleState state) {
  return state == LifecycleState::kExpired;
}

/*
  ACTIVE → EXPIRED only. Reopening an alert means creating a new record,
  which keeps replication of moves idempotent.
*/
constexpr bool CanTransition(LifecycleState from, LifecycleState to) {
  if (from == to) {
    return true;
  }
  return from == LifecycleState::kActive && to == LifecycleState::kExpired;
}

// Directory segment used in record paths.
constexpr std::string_view ToString(LifecycleState state) {
  switch (state) {
    case LifecycleState::kExpired:
      return "expired";
    case LifecycleState::kActive:
    default:
      return "active";
  }
}

constexpr std::optional<LifecycleState> ParseLifecycleState(std::string_view segment) {
  if (segment == "active") return LifecycleState::kActive;
  if (segment == "expired") return LifecycleState::kExpired;
  return std::nullopt;
}

} // namespace alerts::model
