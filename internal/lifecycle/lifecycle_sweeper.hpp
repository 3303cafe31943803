#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/lifecycle/lifecycle_manager.hpp"

namespace alerts::lifecycle {

/*
  Periodically runs LifecycleManager::Sweep and hands every move to the
  callback (which publishes the lifecycle payload).
*/
class LifecycleSweeper {
 public:
  using ChangeCallback = std::function<void(const LifecycleChange&)>;

  LifecycleSweeper(std::shared_ptr<LifecycleManager> manager, std::chrono::milliseconds interval, ChangeCallback on_change);
  ~LifecycleSweeper();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<LifecycleManager> manager_;
  std::chrono::milliseconds         interval_;
  ChangeCallback                    on_change_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace alerts::lifecycle
