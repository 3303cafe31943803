#include "lifecycle_sweeper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace alerts::lifecycle {

LifecycleSweeper::LifecycleSweeper(std::shared_ptr<LifecycleManager> manager, std::chrono::milliseconds interval, ChangeCallback on_change)
    : manager_(std::move(manager)), interval_(interval), on_change_(std::move(on_change)) {
}

LifecycleSweeper::~LifecycleSweeper() {
  Stop();
}

void LifecycleSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&LifecycleSweeper::Loop, this);
}

void LifecycleSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void LifecycleSweeper::Loop() {
  while (running_) {
    try {
      for (const auto& change : manager_->Sweep(alerts::util::Now())) {
        if (on_change_) on_change_(change);
      }
    } catch (const std::exception& e) {
      ALERTS_LOG_ERROR("Lifecycle sweep failed", {alerts::observability::StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [&] { return !running_; });
  }
}

} // namespace alerts::lifecycle
