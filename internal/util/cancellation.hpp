#pragma once

#include <atomic>
#include <string>

#include "internal/util/errors.hpp"

namespace alerts::util {

/*
  Cooperative cancellation flag shared between the pool and an in-flight
  apply. Checked between write steps, never mid-write.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  void ThrowIfCancelled(const std::string& what) const {
    if (IsCancelled()) throw Cancelled("cancelled: " + what);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace alerts::util
