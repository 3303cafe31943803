#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lifecycle/lifecycle_sweeper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using alerts::observability::IntField;
using alerts::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

struct InFlight {
  std::filesystem::path   file;
  alerts::v1::SyncPayload payload;
};

/*
  Tracks inbox files handed to the pool and settles them when the pool
  reports back: applied files are removed, conflicts and rejects move to
  rejected/, exhausted and cancelled ones stay for the next poll.
*/
class InboxTracker {
 public:
  InboxTracker(const alerts::factory::RuntimeDependencies& deps, bool relay) : deps_(deps), relay_(relay) {
  }

  bool Track(const std::string& id, InFlight entry) {
    std::lock_guard lock(mutex_);
    return entries_.emplace(id, std::move(entry)).second;
  }

  bool IsTracked(const std::filesystem::path& file) {
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      if (entry.file == file) return true;
    }
    return false;
  }

  void Forget(const std::string& id) {
    std::lock_guard lock(mutex_);
    entries_.erase(id);
  }

  void Settle(const alerts::sync::TaskReport& report) {
    InFlight entry;
    {
      std::lock_guard lock(mutex_);
      auto it = entries_.find(report.id);
      if (it == entries_.end()) return;
      entry = std::move(it->second);
      entries_.erase(it);
    }

    switch (report.status) {
      case alerts::sync::TaskStatus::kApplied:
        if (relay_ && report.result && report.result->outcome == alerts::sync::ApplyOutcome::kWritten) {
          deps_.outbox->Put(entry.payload);
        }
        deps_.inbox->Remove(entry.file);
        break;
      case alerts::sync::TaskStatus::kConflict:
      case alerts::sync::TaskStatus::kRejected:
        deps_.inbox->Reject(entry.file);
        break;
      case alerts::sync::TaskStatus::kExhausted:
      case alerts::sync::TaskStatus::kCancelled:
        break;
    }
  }

 private:
  const alerts::factory::RuntimeDependencies& deps_;
  const bool                                  relay_;

  std::mutex                                mutex_;
  std::unordered_map<std::string, InFlight> entries_;
};

void PollInbox(const alerts::factory::RuntimeDependencies& deps, alerts::sync::ReplicationPool& pool, InboxTracker& tracker) {
  for (const auto& file : deps.inbox->Pending()) {
    if (!g_running) return;
    if (tracker.IsTracked(file)) continue;

    alerts::v1::SyncPayload payload;
    try {
      payload = deps.inbox->Load(file);
    } catch (const alerts::util::InvalidState& e) {
      ALERTS_LOG_ERROR("Unreadable spool file", {StringField("file", file.string()), StringField("error", e.what())});
      deps.inbox->Reject(file);
      continue;
    }

    const std::string id = payload.id();
    if (!tracker.Track(id, InFlight{file, payload})) continue;
    if (!pool.Submit(std::move(payload))) tracker.Forget(id);
  }
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: alerts-station <config.yaml> OR alerts-station --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = alerts::config::ConfigLoader::LoadFromYaml(config_path);

    alerts::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build runtime (dependency graph)
    // ------------------------------------------------------------
    auto deps = alerts::factory::BuildRuntime(config);

    InboxTracker tracker(deps, config.spool().relay());

    alerts::sync::ReplicationPool pool(deps.replicator, alerts::factory::PoolOptionsFromConfig(config),
                                       [&tracker](const alerts::sync::TaskReport& report) { tracker.Settle(report); });

    alerts::lifecycle::LifecycleSweeper sweeper(deps.lifecycle, alerts::util::FromProto(config.lifecycle().sweep_interval()),
                                                [&deps](const alerts::lifecycle::LifecycleChange& change) {
                                                  deps.authoring->PublishLifecycle(change);
                                                });

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    pool.Start();
    sweeper.Start();

    ALERTS_LOG_INFO("Alerts station started", {StringField("root", config.storage().root()), StringField("inbox", config.spool().inbox()),
                                               IntField("workers", config.replication().workers())});

    const auto poll_interval = alerts::util::FromProto(config.spool().poll_interval());
    while (g_running) {
      try {
        PollInbox(deps, pool, tracker);
      } catch (const alerts::util::IOError& e) {
        ALERTS_LOG_ERROR("Inbox poll failed", {StringField("error", e.what())});
      }
      std::this_thread::sleep_for(poll_interval);
    }

    ALERTS_LOG_INFO("Shutting down alerts station");

    sweeper.Stop();
    pool.Stop();

    const auto stats = pool.Stats();
    ALERTS_LOG_INFO("Replication totals", {IntField("applied", static_cast<int64_t>(stats.applied)),
                                           IntField("conflicts", static_cast<int64_t>(stats.conflicts)),
                                           IntField("rejected", static_cast<int64_t>(stats.rejected)),
                                           IntField("retries", static_cast<int64_t>(stats.retries))});
    alerts::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ALERTS_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    alerts::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
