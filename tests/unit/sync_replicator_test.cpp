#include "internal/sync/sync_replicator.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/model/alert_record.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/store/manifest.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace {

using alerts::model::LifecycleState;
using alerts::store::RecordStore;
using alerts::sync::ApplyOutcome;
using alerts::sync::SyncReplicator;
using alerts::v1::SyncPayload;

namespace fs = std::filesystem;

// Slug the local codec would not derive from the title in the manifest.
constexpr const char* kPath    = "38.7_-9.1/active/2025-12-14_15-32_test-alert-with-photos-v0";
constexpr const char* kExpired = "38.7_-9.1/expired/2025-12-14_15-32_test-alert-with-photos-v0";

struct Fixture {
  fs::path                        root;
  std::shared_ptr<RecordStore>    store;
  std::shared_ptr<SyncReplicator> replicator;
};

Fixture MakeFixture(const std::string& name) {
  Fixture fixture;
  fixture.root = fs::temp_directory_path() / "alerts_sync_replicator_tests" / name;
  fs::remove_all(fixture.root);

  alerts::store::RecordStoreOptions options;
  options.root       = fixture.root;
  fixture.store      = std::make_shared<RecordStore>(options, std::make_shared<alerts::lock::PathLockTable>(std::chrono::seconds(2)));
  fixture.replicator = std::make_shared<SyncReplicator>(fixture.store);
  return fixture;
}

std::string ManifestBytes() {
  alerts::model::AlertRecord record;
  record.title       = "Test Alert With Photos";
  record.created_at  = alerts::util::ParseIso8601("2025-12-14T15:32:00Z");
  record.coordinates = {38.7223, -9.1393};
  record.author      = "X13K0G";
  return alerts::store::FormatManifest(record);
}

SyncPayload MakePayload(alerts::v1::PayloadKind kind, const std::string& path, const std::string& file_name, const std::string& content) {
  SyncPayload payload;
  payload.set_id("0f8e4f7a-51c2-4c7e-9d1b-3e2a7c9b1d00");
  payload.set_kind(kind);
  payload.set_path(path);
  payload.set_file_name(file_name);
  payload.set_content(content);
  payload.set_content_hash(alerts::util::Sha256Hex(content));
  return payload;
}

SyncPayload RecordPayload() {
  return MakePayload(alerts::v1::PAYLOAD_KIND_RECORD, kPath, "manifest.txt", ManifestBytes());
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestRecordCreatedAtLiteralPath() {
  auto fixture = MakeFixture("record");

  const auto result = fixture.replicator->Apply(RecordPayload());
  assert(result.outcome == ApplyOutcome::kWritten);
  assert(result.target.ToString() == kPath);

  const auto dir = fixture.root / kPath;
  assert(fs::is_directory(dir / "images"));
  assert(fs::is_directory(dir / "comments"));
  assert(alerts::storage::ReadFile(dir / "manifest.txt") == ManifestBytes());
}

void TestApplyIsIdempotent() {
  auto fixture = MakeFixture("idempotent");

  const auto payload = RecordPayload();
  assert(fixture.replicator->Apply(payload).outcome == ApplyOutcome::kWritten);
  assert(fixture.replicator->Apply(payload).outcome == ApplyOutcome::kNoop);

  const auto photo = MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, kPath, "photo1.jpg", "jpeg");
  assert(fixture.replicator->Apply(photo).outcome == ApplyOutcome::kWritten);
  assert(fixture.replicator->Apply(photo).outcome == ApplyOutcome::kNoop);
}

void TestOriginNamesKeptVerbatim() {
  auto fixture = MakeFixture("verbatim");
  fixture.replicator->Apply(RecordPayload());

  // photo7 into an empty images/, a _5 comment with no predecessors
  fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, kPath, "photo7.jpg", "seventh"));
  fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_COMMENT, kPath, "2025-12-14_21-15-23_X13K0G_5.txt",
                                        "> 2025-12-14 21:15_23 -- X13K0G\nhello\n"));

  const auto dir = fixture.root / kPath;
  assert(fs::exists(dir / "images" / "photo7.jpg"));
  assert(!fs::exists(dir / "images" / "photo1.jpg"));
  assert(fs::exists(dir / "comments" / "2025-12-14_21-15-23_X13K0G_5.txt"));
  assert(!fs::exists(dir / "comments" / "2025-12-14_21-15-23_X13K0G.txt"));
}

void TestDivergentContentPreservedAsConflict() {
  auto fixture = MakeFixture("conflict");
  fixture.replicator->Apply(RecordPayload());
  fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, kPath, "photo1.jpg", "original"));

  const auto incoming = MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, kPath, "photo1.jpg", "different");
  const auto result   = fixture.replicator->Apply(incoming);

  assert(result.outcome == ApplyOutcome::kConflict);
  const auto images = fixture.root / kPath / "images";
  assert(alerts::storage::ReadFile(images / "photo1.jpg") == "original");
  assert(result.conflict_path == images / ("photo1.jpg.conflict-" + alerts::util::Sha256Hex("different").substr(0, 8)));
  assert(alerts::storage::ReadFile(result.conflict_path) == "different");

  // re-delivery of the same conflicting payload does not pile up copies
  const auto again = fixture.replicator->Apply(incoming);
  assert(again.outcome == ApplyOutcome::kConflict);
  assert(again.conflict_path == result.conflict_path);
}

void TestTraversalRejected() {
  auto fixture = MakeFixture("traversal");
  fixture.replicator->Apply(RecordPayload());

  assert(Throws<alerts::util::PathTraversalRejected>(
      [&] { fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_RECORD, "../../etc", "manifest.txt", "x")); }));
  assert(Throws<alerts::util::PathTraversalRejected>(
      [&] { fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, kPath, "../manifest.txt", "x")); }));
  assert(Throws<alerts::util::PathTraversalRejected>(
      [&] { fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_COMMENT, kPath, "../../../../../tmp/evil.txt", "x")); }));
  assert(Throws<alerts::util::PathTraversalRejected>(
      [&] { fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, kPath, "IMG_0001.JPG", "x")); }));

  assert(alerts::storage::ReadFile(fixture.root / kPath / "manifest.txt") == ManifestBytes());
}

void TestContentHashMismatchRejected() {
  auto fixture = MakeFixture("hash");
  auto payload = RecordPayload();
  payload.set_content_hash(alerts::util::Sha256Hex("something else"));

  assert(Throws<alerts::util::ContentHashMismatch>([&] { fixture.replicator->Apply(payload); }));
  assert(!fs::exists(fixture.root / kPath));
}

void TestArtifactBeforeRecordIsNotFound() {
  auto fixture = MakeFixture("ordering");

  const auto photo = MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, kPath, "photo1.jpg", "jpeg");
  assert(Throws<alerts::util::NotFound>([&] { fixture.replicator->Apply(photo); }));

  fixture.replicator->Apply(RecordPayload());
  assert(fixture.replicator->Apply(photo).outcome == ApplyOutcome::kWritten);
}

SyncPayload LifecyclePayload() {
  SyncPayload payload;
  payload.set_id("5a1c2b3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d");
  payload.set_kind(alerts::v1::PAYLOAD_KIND_LIFECYCLE);
  payload.set_path(kExpired);
  (*payload.mutable_header())["from"]   = kPath;
  (*payload.mutable_header())["reason"] = "ttl";
  return payload;
}

void TestLifecycleMoveReplicates() {
  auto fixture = MakeFixture("lifecycle");

  assert(Throws<alerts::util::NotFound>([&] { fixture.replicator->Apply(LifecyclePayload()); }));

  fixture.replicator->Apply(RecordPayload());
  fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, kPath, "photo1.jpg", "jpeg"));

  const auto result = fixture.replicator->Apply(LifecyclePayload());
  assert(result.outcome == ApplyOutcome::kWritten);
  assert(result.target.ToString() == kExpired);
  assert(!fs::exists(fixture.root / kPath));
  assert(fs::exists(fixture.root / kExpired / "images" / "photo1.jpg"));

  assert(fixture.replicator->Apply(LifecyclePayload()).outcome == ApplyOutcome::kNoop);

  // late comment after the move lands in the expired record
  fixture.replicator->Apply(MakePayload(alerts::v1::PAYLOAD_KIND_COMMENT, kPath, "2025-12-14_21-15-23_X13K0G.txt", "late"));
  assert(fs::exists(fixture.root / kExpired / "comments" / "2025-12-14_21-15-23_X13K0G.txt"));

  // resent manifest does not resurrect the active folder
  assert(fixture.replicator->Apply(RecordPayload()).outcome == ApplyOutcome::kNoop);
  assert(!fs::exists(fixture.root / kPath));
}

void TestLifecycleCannotChangeIdentity() {
  auto fixture = MakeFixture("lifecycle_identity");
  fixture.replicator->Apply(RecordPayload());

  auto payload                          = LifecyclePayload();
  (*payload.mutable_header())["from"] = "38.7_-9.1/active/2025-12-14_15-32_other-record";

  assert(Throws<alerts::util::InvalidState>([&] { fixture.replicator->Apply(payload); }));
  assert(fs::exists(fixture.root / kPath));
}

void TestCancelledApplyLeavesNothing() {
  auto fixture = MakeFixture("cancel");

  alerts::util::CancellationToken token;
  token.Cancel();

  assert(Throws<alerts::util::Cancelled>([&] { fixture.replicator->Apply(RecordPayload(), &token); }));
  assert(!fs::exists(fixture.root / kPath));
}

} // namespace

int main() {
  TestRecordCreatedAtLiteralPath();
  TestApplyIsIdempotent();
  TestOriginNamesKeptVerbatim();
  TestDivergentContentPreservedAsConflict();
  TestTraversalRejected();
  TestContentHashMismatchRejected();
  TestArtifactBeforeRecordIsNotFound();
  TestLifecycleMoveReplicates();
  TestLifecycleCannotChangeIdentity();
  TestCancelledApplyLeavesNothing();

  std::cout << "alerts_unit_sync_replicator: pass\n";
  return 0;
}
