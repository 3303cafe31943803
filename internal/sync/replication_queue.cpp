#include "replication_queue.hpp"

#include <algorithm>
#include <stdexcept>

namespace alerts::sync {

ReplicationQueue::ReplicationQueue(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw std::invalid_argument("replication queue capacity must be > 0");
}

bool ReplicationQueue::Enqueue(ReplicationTask task) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return shutdown_ || queue_.size() < capacity_; });
    if (shutdown_) return false;
    queue_.push_back(std::move(task));
  }
  not_empty_.notify_one();
  return true;
}

bool ReplicationQueue::TryEnqueue(ReplicationTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push_back(std::move(task));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<ReplicationTask> ReplicationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  ReplicationTask task = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();

  not_full_.notify_one();
  return task;
}

bool ReplicationQueue::Remove(const std::string& id) {
  {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(), [&](const ReplicationTask& task) { return task.Id() == id; });
    if (it == queue_.end()) return false;
    queue_.erase(it);
  }
  not_full_.notify_one();
  return true;
}

void ReplicationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t ReplicationQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace alerts::sync
