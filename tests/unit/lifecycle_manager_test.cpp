#include "internal/lifecycle/lifecycle_manager.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include "internal/lifecycle/lifecycle_sweeper.hpp"
#include "internal/store/manifest.hpp"
#include "internal/store/record_store.hpp"
#include "internal/sync/sync_replicator.hpp"
#include "internal/util/errors.hpp"

namespace {

using alerts::lifecycle::LifecycleManager;
using alerts::model::AlertRecord;
using alerts::model::LifecycleState;
using alerts::model::RecordPath;
using alerts::store::RecordStore;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

constexpr auto kTtl = std::chrono::hours(24);

constexpr const char* kLocalAuthor = "X13K0G";

struct Fixture {
  std::shared_ptr<RecordStore>      store;
  std::shared_ptr<LifecycleManager> manager;
};

Fixture MakeFixture(const std::string& name) {
  const auto root = fs::temp_directory_path() / "alerts_lifecycle_manager_tests" / name;
  fs::remove_all(root);

  alerts::store::RecordStoreOptions options;
  options.root = root;

  Fixture fixture;
  fixture.store   = std::make_shared<RecordStore>(options, std::make_shared<alerts::lock::PathLockTable>(2s));
  fixture.manager = std::make_shared<LifecycleManager>(fixture.store, std::chrono::duration_cast<std::chrono::seconds>(kTtl), kLocalAuthor);
  return fixture;
}

AlertRecord MakeRecord(const std::string& title, const std::string& created) {
  AlertRecord record;
  record.title       = title;
  record.created_at  = alerts::util::ParseIso8601(created);
  record.coordinates = {38.7223, -9.1393};
  record.author      = kLocalAuthor;
  return record;
}

// Lands a record authored on another device the way replication does.
RecordPath ReplicateForeignRecord(const Fixture& fixture, const std::string& path) {
  auto record   = MakeRecord("Flood", "2025-12-14T15:32:00Z");
  record.author = "OTHER1";

  alerts::v1::SyncPayload payload;
  payload.set_id("5f0c1c1e-8d1b-4a57-9a43-0d7f3c1b2e10");
  payload.set_kind(alerts::v1::PAYLOAD_KIND_RECORD);
  payload.set_path(path);
  payload.set_file_name("manifest.txt");
  payload.set_content(alerts::store::FormatManifest(record));

  alerts::sync::SyncReplicator replicator(fixture.store);
  const auto                   result = replicator.Apply(payload);
  assert(result.outcome == alerts::sync::ApplyOutcome::kWritten);
  return result.target;
}

const auto kCreated = alerts::util::ParseIso8601("2025-12-14T15:32:00Z");

void TestDueExactlyAtTtl() {
  auto fixture = MakeFixture("due");
  auto record  = MakeRecord("Flood", "2025-12-14T15:32:00Z");

  assert(!fixture.manager->IsDue(record, kCreated + kTtl - 1s));
  assert(fixture.manager->IsDue(record, kCreated + kTtl));
}

void TestTtlMetadataOverridesDefault() {
  auto fixture    = MakeFixture("ttl_override");
  auto record     = MakeRecord("Flood", "2025-12-14T15:32:00Z");
  record.metadata = {{"ttl", "3600"}};

  assert(fixture.manager->ExpiresAt(record) == kCreated + 1h);
  assert(fixture.manager->IsDue(record, kCreated + 1h));
}

void TestExpireMovesStateSegmentOnly() {
  auto       fixture = MakeFixture("expire");
  const auto path    = fixture.store->Create(MakeRecord("Flood", "2025-12-14T15:32:00Z"));

  bool not_due = false;
  try {
    fixture.manager->Expire(path, kCreated + 1h);
  } catch (const alerts::util::InvalidState&) {
    not_due = true;
  }
  assert(not_due);

  const auto change = fixture.manager->Expire(path, kCreated + kTtl);
  assert(change.Moved());
  assert(change.from == path);
  assert(change.to == path.WithState(LifecycleState::kExpired));
  assert(change.to.ToString() == "38.7_-9.1/expired/2025-12-14_15-32_flood");
  assert(fixture.store->Exists(change.to));

  // already expired: no-op
  const auto again = fixture.manager->Expire(path, kCreated + kTtl);
  assert(!again.Moved());
}

void TestCloseOnlyByAuthor() {
  auto       fixture = MakeFixture("close");
  const auto path    = fixture.store->Create(MakeRecord("Fire", "2025-12-14T15:32:00Z"));

  bool denied = false;
  try {
    fixture.manager->Close(path, "Q7ZZ01");
  } catch (const alerts::util::PermissionDenied&) {
    denied = true;
  }
  assert(denied);
  assert(fixture.store->Exists(path));

  const auto change = fixture.manager->Close(path, "X13K0G");
  assert(change.Moved());
  assert(change.reason == "closed");
}

void TestSweepExpiresOnlyDueRecords() {
  auto       fixture = MakeFixture("sweep");
  const auto old     = fixture.store->Create(MakeRecord("Old", "2025-12-01T10:00:00Z"));
  const auto fresh   = fixture.store->Create(MakeRecord("Fresh", "2025-12-14T15:00:00Z"));

  const auto changes = fixture.manager->Sweep(kCreated);
  assert(changes.size() == 1);
  assert(changes[0].from == old);
  assert(fixture.store->Exists(fresh));
  assert(fixture.store->List(LifecycleState::kExpired).size() == 1);

  assert(fixture.manager->Sweep(kCreated).empty());
}

void TestReplicatedRecordsExpireOnlyThroughTheirAuthor() {
  auto       fixture = MakeFixture("foreign");
  const auto path    = ReplicateForeignRecord(fixture, "38.7_-9.1/active/2025-12-14_15-32_flood");

  assert(fixture.manager->Sweep(kCreated + 2 * kTtl).empty());
  assert(fixture.store->Exists(path));

  bool denied = false;
  try {
    fixture.manager->Expire(path, kCreated + 2 * kTtl);
  } catch (const alerts::util::PermissionDenied&) {
    denied = true;
  }
  assert(denied);
  assert(fixture.store->Exists(path));

  // the author's decision arrives as a lifecycle payload
  alerts::v1::SyncPayload moved;
  moved.set_id("9a1b2c3d-4e5f-4a6b-8c7d-0e1f2a3b4c5d");
  moved.set_kind(alerts::v1::PAYLOAD_KIND_LIFECYCLE);
  moved.set_path("38.7_-9.1/expired/2025-12-14_15-32_flood");
  (*moved.mutable_header())["from"] = path.ToString();

  alerts::sync::SyncReplicator replicator(fixture.store);
  assert(replicator.Apply(moved).outcome == alerts::sync::ApplyOutcome::kWritten);
  assert(fixture.store->Exists(path.WithState(LifecycleState::kExpired)));
}

void TestNodeWithoutCallsignNeverSweeps() {
  auto fixture    = MakeFixture("no_callsign");
  fixture.manager = std::make_shared<LifecycleManager>(fixture.store, std::chrono::seconds(1), "");
  fixture.store->Create(MakeRecord("Old", "2020-01-01T00:00:00Z"));

  assert(fixture.manager->Sweep(kCreated).empty());
  assert(fixture.store->List(LifecycleState::kActive).size() == 1);
}

void TestSweepSkipsBrokenRecords() {
  auto       fixture = MakeFixture("sweep_broken");
  const auto good    = fixture.store->Create(MakeRecord("Good", "2025-12-01T10:00:00Z"));
  const auto broken  = fixture.store->Create(MakeRecord("Broken", "2025-12-01T11:00:00Z"));

  fs::remove(fixture.store->Absolute(broken) / "manifest.txt");

  const auto changes = fixture.manager->Sweep(kCreated);
  assert(changes.size() == 1);
  assert(changes[0].from == good);
  assert(fixture.store->Exists(broken));
}

void TestSweeperPublishesChanges() {
  auto fixture = MakeFixture("sweeper");
  fixture.store->Create(MakeRecord("Old", "2020-01-01T00:00:00Z"));

  std::atomic<int> published{0};
  {
    alerts::lifecycle::LifecycleSweeper sweeper(fixture.manager, 10ms, [&](const alerts::lifecycle::LifecycleChange&) { ++published; });
    sweeper.Start();

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (published == 0 && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(5ms);
    sweeper.Stop();
  }

  assert(published == 1);
  assert(fixture.store->List(LifecycleState::kActive).empty());
}

} // namespace

int main() {
  TestDueExactlyAtTtl();
  TestTtlMetadataOverridesDefault();
  TestExpireMovesStateSegmentOnly();
  TestCloseOnlyByAuthor();
  TestSweepExpiresOnlyDueRecords();
  TestReplicatedRecordsExpireOnlyThroughTheirAuthor();
  TestNodeWithoutCallsignNeverSweeps();
  TestSweepSkipsBrokenRecords();
  TestSweeperPublishesChanges();

  std::cout << "alerts_unit_lifecycle_manager: pass\n";
  return 0;
}
