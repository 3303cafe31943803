#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "replication_queue.hpp"
#include "sync_replicator.hpp"

namespace alerts::sync {

struct ReplicationPoolOptions {
  std::size_t workers        = 4;
  std::size_t queue_capacity = 256;
  uint32_t    max_attempts   = 5;

  std::chrono::milliseconds initial_backoff{200};
  std::chrono::milliseconds max_backoff{10000};
};

enum class TaskStatus {
  kApplied,    // written or already identical
  kConflict,   // incoming bytes preserved beside the original
  kRejected,   // non-retryable error
  kExhausted,  // retryable error on every attempt
  kCancelled,
};

std::string_view ToString(TaskStatus status);

struct TaskReport {
  std::string                id;
  TaskStatus                 status = TaskStatus::kApplied;
  std::optional<ApplyResult> result;
  std::string                error;
  uint32_t                   attempts = 0;
};

struct PoolStats {
  uint64_t submitted = 0;
  uint64_t applied   = 0;
  uint64_t conflicts = 0;
  uint64_t rejected  = 0;
  uint64_t exhausted = 0;
  uint64_t cancelled = 0;
  uint64_t retries   = 0;
};

/*
  ReplicationPool

  Background workers applying received payloads through the SyncReplicator.

  Retry policy:
    LockTimeout, IOError, NotFound  → exponential backoff, up to max_attempts
    everything else                 → final, reported as rejected

  Every submitted task ends in exactly one completion callback.
*/
class ReplicationPool {
 public:
  using CompletionCallback = std::function<void(const TaskReport&)>;

  ReplicationPool(std::shared_ptr<SyncReplicator> replicator, ReplicationPoolOptions options, CompletionCallback on_complete = {});
  ~ReplicationPool();

  void Start();

  // Tasks still queued or waiting for a retry complete as cancelled.
  void Stop();

  // Blocks while the queue is full. Returns false when the pool is stopped
  // or a task with the same id is still pending.
  bool Submit(alerts::v1::SyncPayload payload);

  // Non-blocking Submit; also returns false when the queue is full.
  bool TrySubmit(alerts::v1::SyncPayload payload);

  // Cancels a queued or in-flight task. Returns false for unknown ids.
  bool Cancel(const std::string& id);

  bool IsPending(const std::string& id) const;

  // Blocks until no submitted task is pending.
  void WaitIdle();

  PoolStats Stats() const;

 private:
  bool       Register(const ReplicationTask& task);
  void       Unregister(const std::string& id);
  void       Run();
  TaskReport Execute(const ReplicationTask& task);
  bool       WaitBackoff(const ReplicationTask& task, uint32_t attempt);
  void       Finish(const TaskReport& report);

  std::shared_ptr<SyncReplicator> replicator_;
  ReplicationPoolOptions          options_;
  CompletionCallback              on_complete_;

  ReplicationQueue         queue_;
  std::vector<std::thread> threads_;

  mutable std::mutex                                                       mutex_;
  std::condition_variable                                                  idle_cv_;
  std::condition_variable                                                  backoff_cv_;
  std::unordered_map<std::string, std::shared_ptr<alerts::util::CancellationToken>> pending_;
  bool                                                                     running_  = false;
  bool                                                                     stopping_ = false;

  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> applied_{0};
  std::atomic<uint64_t> conflicts_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> exhausted_{0};
  std::atomic<uint64_t> cancelled_{0};
  std::atomic<uint64_t> retries_{0};
};

} // namespace alerts::sync
