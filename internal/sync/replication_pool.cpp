#include "replication_pool.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace alerts::sync {

using alerts::observability::IntField;
using alerts::observability::StringField;

std::string_view ToString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kApplied:
      return "applied";
    case TaskStatus::kConflict:
      return "conflict";
    case TaskStatus::kRejected:
      return "rejected";
    case TaskStatus::kExhausted:
      return "exhausted";
    case TaskStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

ReplicationPool::ReplicationPool(std::shared_ptr<SyncReplicator> replicator, ReplicationPoolOptions options, CompletionCallback on_complete)
    : replicator_(std::move(replicator)),
      options_(options),
      on_complete_(std::move(on_complete)),
      queue_(options.queue_capacity) {
  if (options_.workers == 0) throw std::invalid_argument("replication pool needs at least one worker");
  if (options_.max_attempts == 0) options_.max_attempts = 1;
}

ReplicationPool::~ReplicationPool() {
  Stop();
}

void ReplicationPool::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_ || stopping_) return;
    running_ = true;
  }

  for (std::size_t i = 0; i < options_.workers; ++i) {
    threads_.emplace_back(&ReplicationPool::Run, this);
  }
  ALERTS_LOG_INFO("Replication pool started", {IntField("workers", static_cast<int64_t>(options_.workers))});
}

void ReplicationPool::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_  = false;
    stopping_ = true;
  }
  backoff_cv_.notify_all();
  queue_.Shutdown();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

bool ReplicationPool::Register(const ReplicationTask& task) {
  std::lock_guard lock(mutex_);
  if (!running_) return false;
  if (!pending_.emplace(task.Id(), task.cancel).second) {
    ALERTS_LOG_DEBUG("Payload already pending", {StringField("id", task.Id())});
    return false;
  }
  return true;
}

void ReplicationPool::Unregister(const std::string& id) {
  std::lock_guard lock(mutex_);
  pending_.erase(id);
  if (pending_.empty()) idle_cv_.notify_all();
}

bool ReplicationPool::Submit(alerts::v1::SyncPayload payload) {
  ReplicationTask task;
  task.payload = std::move(payload);
  if (!Register(task)) return false;

  const std::string id = task.Id();
  if (!queue_.Enqueue(std::move(task))) {
    Unregister(id);
    return false;
  }
  ++submitted_;
  return true;
}

bool ReplicationPool::TrySubmit(alerts::v1::SyncPayload payload) {
  ReplicationTask task;
  task.payload = std::move(payload);
  if (!Register(task)) return false;

  const std::string id = task.Id();
  if (!queue_.TryEnqueue(std::move(task))) {
    Unregister(id);
    return false;
  }
  ++submitted_;
  return true;
}

bool ReplicationPool::Cancel(const std::string& id) {
  {
    std::lock_guard lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return false;
    it->second->Cancel();
  }
  backoff_cv_.notify_all();

  // still queued: no worker will see it
  if (queue_.Remove(id)) {
    TaskReport report;
    report.id     = id;
    report.status = TaskStatus::kCancelled;
    report.error  = "cancelled before apply";
    Finish(report);
  }
  return true;
}

bool ReplicationPool::IsPending(const std::string& id) const {
  std::lock_guard lock(mutex_);
  return pending_.count(id) > 0;
}

void ReplicationPool::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return pending_.empty(); });
}

PoolStats ReplicationPool::Stats() const {
  PoolStats stats;
  stats.submitted = submitted_.load();
  stats.applied   = applied_.load();
  stats.conflicts = conflicts_.load();
  stats.rejected  = rejected_.load();
  stats.exhausted = exhausted_.load();
  stats.cancelled = cancelled_.load();
  stats.retries   = retries_.load();
  return stats;
}

void ReplicationPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    Finish(Execute(*task));
  }
}

TaskReport ReplicationPool::Execute(const ReplicationTask& task) {
  TaskReport report;
  report.id = task.Id();

  for (uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    report.attempts = attempt;

    {
      std::lock_guard lock(mutex_);
      if (stopping_) {
        report.status = TaskStatus::kCancelled;
        report.error  = "replication pool stopped";
        return report;
      }
    }

    try {
      auto result   = replicator_->Apply(task.payload, task.cancel.get());
      report.status = result.outcome == ApplyOutcome::kConflict ? TaskStatus::kConflict : TaskStatus::kApplied;
      report.result = std::move(result);
      return report;
    } catch (const alerts::util::Cancelled& e) {
      report.status = TaskStatus::kCancelled;
      report.error  = e.what();
      return report;
    } catch (const alerts::util::RetryableError& e) {
      report.error = e.what();
    } catch (const alerts::util::NotFound& e) {
      report.error = e.what();
    } catch (const std::exception& e) {
      report.status = TaskStatus::kRejected;
      report.error  = e.what();
      return report;
    }

    if (attempt == options_.max_attempts) break;

    ++retries_;
    ALERTS_LOG_WARN("Replication attempt failed, retrying",
                    {StringField("id", report.id), IntField("attempt", attempt), StringField("error", report.error)});

    if (!WaitBackoff(task, attempt)) {
      report.status = TaskStatus::kCancelled;
      return report;
    }
  }

  report.status = TaskStatus::kExhausted;
  return report;
}

// Returns false when the wait was interrupted by Cancel or Stop.
bool ReplicationPool::WaitBackoff(const ReplicationTask& task, uint32_t attempt) {
  auto delay = options_.initial_backoff;
  for (uint32_t i = 1; i < attempt && delay < options_.max_backoff; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, options_.max_backoff);

  std::unique_lock lock(mutex_);
  const bool interrupted = backoff_cv_.wait_for(lock, delay, [&] { return stopping_ || task.cancel->IsCancelled(); });
  return !interrupted;
}

void ReplicationPool::Finish(const TaskReport& report) {
  switch (report.status) {
    case TaskStatus::kApplied:
      ++applied_;
      break;
    case TaskStatus::kConflict:
      ++conflicts_;
      break;
    case TaskStatus::kRejected:
      ++rejected_;
      ALERTS_LOG_ERROR("Payload rejected", {StringField("id", report.id), StringField("error", report.error)});
      break;
    case TaskStatus::kExhausted:
      ++exhausted_;
      ALERTS_LOG_ERROR("Payload retries exhausted",
                       {StringField("id", report.id), IntField("attempts", report.attempts), StringField("error", report.error)});
      break;
    case TaskStatus::kCancelled:
      ++cancelled_;
      ALERTS_LOG_INFO("Payload cancelled", {StringField("id", report.id)});
      break;
  }

  if (on_complete_) {
    try {
      on_complete_(report);
    } catch (const std::exception& e) {
      ALERTS_LOG_ERROR("Completion callback failed", {StringField("id", report.id), StringField("error", e.what())});
    }
  }

  Unregister(report.id);
}

} // namespace alerts::sync
