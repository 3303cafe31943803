#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "replication_task.hpp"

namespace alerts::sync {

/*
  Thread-safe bounded blocking queue for replication workers.
*/
class ReplicationQueue {
 public:
  explicit ReplicationQueue(std::size_t capacity);

  // Blocks while full. Returns false once shut down.
  bool Enqueue(ReplicationTask task);

  // Returns false when full or shut down.
  bool TryEnqueue(ReplicationTask task);

  // blocking wait
  std::optional<ReplicationTask> Dequeue();

  // Drops a queued task. Returns false when no queued task has this id.
  bool Remove(const std::string& id);

  void Shutdown();

  std::size_t Size() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex          mutex_;
  std::condition_variable     not_empty_;
  std::condition_variable     not_full_;
  std::deque<ReplicationTask> queue_;
  bool                        shutdown_ = false;
};

} // namespace alerts::sync
