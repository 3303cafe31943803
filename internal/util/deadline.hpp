#pragma once

#include <chrono>
#include <string>

#include "internal/util/errors.hpp"

namespace alerts::util {

/*
  Time budget for directory scans that run while a record or bucket lock
  is held. Check() throws LockTimeout once the budget is spent, so the
  operation fails retryable instead of holding the lock indefinitely.
*/
class Deadline {
 public:
  explicit Deadline(std::chrono::milliseconds budget) : expires_(std::chrono::steady_clock::now() + budget) {
  }

  bool Expired() const {
    return std::chrono::steady_clock::now() >= expires_;
  }

  void Check(const std::string& what) const {
    if (Expired()) throw LockTimeout(what + " exceeded its time budget");
  }

 private:
  std::chrono::steady_clock::time_point expires_;
};

} // namespace alerts::util
