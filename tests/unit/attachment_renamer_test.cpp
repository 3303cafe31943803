#include "internal/store/attachment_renamer.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/storage/atomic_file.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace {

using alerts::model::AlertRecord;
using alerts::model::LifecycleState;
using alerts::model::RecordPath;
using alerts::store::AttachmentRenamer;
using alerts::store::RecordStore;

namespace fs = std::filesystem;

struct Fixture {
  fs::path                           root;
  std::shared_ptr<RecordStore>       store;
  std::shared_ptr<AttachmentRenamer> renamer;
  RecordPath                         path;
};

Fixture MakeFixture(const std::string& name) {
  Fixture fixture;
  fixture.root = fs::temp_directory_path() / "alerts_attachment_renamer_tests" / name;
  fs::remove_all(fixture.root);

  alerts::store::RecordStoreOptions options;
  options.root    = fixture.root;
  fixture.store   = std::make_shared<RecordStore>(options, std::make_shared<alerts::lock::PathLockTable>(std::chrono::seconds(5)));
  fixture.renamer = std::make_shared<AttachmentRenamer>(fixture.store);

  AlertRecord record;
  record.title       = "Test Alert With Photos";
  record.created_at  = alerts::util::ParseIso8601("2025-12-14T15:32:00Z");
  record.coordinates = {38.7223, -9.1393};
  record.author      = "X13K0G";
  fixture.path       = fixture.store->Create(record);
  return fixture;
}

fs::path ImagesDir(const Fixture& fixture) {
  return fixture.store->Absolute(*fixture.store->Resolve(fixture.path)) / "images";
}

void TestNamesFollowAttachOrderAndHideOriginalName() {
  auto fixture = MakeFixture("sequential");

  const auto first  = fixture.renamer->Attach(fixture.path, "IMG_20251214_153201.JPG", "jpeg-bytes");
  const auto second = fixture.renamer->Attach(fixture.path, "/home/me/Screenshot 1.png", "png-bytes");

  assert(first.file_name == "photo1.jpg");
  assert(second.file_name == "photo2.png");
  assert(first.content_hash == alerts::util::Sha256Hex("jpeg-bytes"));

  std::vector<std::string> on_disk;
  for (const auto& entry : fs::directory_iterator(ImagesDir(fixture))) on_disk.push_back(entry.path().filename().string());
  std::sort(on_disk.begin(), on_disk.end());
  assert((on_disk == std::vector<std::string>{"photo1.jpg", "photo2.png"}));

  assert(alerts::storage::ReadFile(ImagesDir(fixture) / "photo2.png") == "png-bytes");
  assert((fixture.renamer->List(fixture.path) == std::vector<std::string>{"photo1.jpg", "photo2.png"}));
}

void TestUnknownExtensionIsCoercedNotRejected() {
  auto fixture = MakeFixture("coerced");

  const auto result = fixture.renamer->Attach(fixture.path, "scan.tiff", "tiff-bytes");
  assert(result.file_name == "photo1.bin");
  assert(result.extension_coerced);
}

void TestIdenticalBytesAreDeduplicated() {
  auto fixture = MakeFixture("dedup");

  const auto first = fixture.renamer->Attach(fixture.path, "a.jpg", "same-bytes");
  const auto again = fixture.renamer->Attach(fixture.path, "b.jpg", "same-bytes");

  assert(again.deduplicated);
  assert(again.file_name == first.file_name);
  assert(fixture.renamer->List(fixture.path).size() == 1);

  const auto other = fixture.renamer->Attach(fixture.path, "c.jpg", "other-bytes");
  assert(other.file_name == "photo2.jpg");
}

void TestConcurrentAttachesProduceContiguousNames() {
  auto fixture = MakeFixture("concurrent");

  constexpr int            kThreads = 8;
  std::vector<std::string> names(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] { names[t] = fixture.renamer->Attach(fixture.path, "x.jpg", "bytes-" + std::to_string(t)).file_name; });
  }
  for (auto& thread : threads) thread.join();

  std::set<std::string> unique(names.begin(), names.end());
  assert(unique.size() == kThreads);
  for (int i = 1; i <= kThreads; ++i) {
    assert(unique.count("photo" + std::to_string(i) + ".jpg") == 1);
  }
}

void TestIndexGapDoesNotCollide() {
  auto fixture = MakeFixture("gap");

  // a replica holding photo3 but not photo1/photo2 yet
  alerts::storage::WriteFileAtomic(ImagesDir(fixture) / "photo3.jpg", "third", false);

  const auto result = fixture.renamer->Attach(fixture.path, "new.jpg", "local");
  assert(result.file_name == "photo4.jpg");
  assert(alerts::storage::ReadFile(ImagesDir(fixture) / "photo3.jpg") == "third");
}

void TestAttachToExpiredRecordLandsInPlace() {
  auto fixture = MakeFixture("expired");
  fixture.store->Move(fixture.path, LifecycleState::kActive, LifecycleState::kExpired);

  const auto result = fixture.renamer->Attach(fixture.path, "late.jpg", "late-bytes");
  assert(result.file_name == "photo1.jpg");
  assert(fs::exists(fixture.store->Absolute(fixture.path.WithState(LifecycleState::kExpired)) / "images" / "photo1.jpg"));
}

void TestAttachToMissingRecordIsNotFound() {
  auto fixture = MakeFixture("missing");

  RecordPath ghost{"38.7_-9.1", LifecycleState::kActive, "2025-12-14_15-32_ghost"};
  bool       not_found = false;
  try {
    fixture.renamer->Attach(ghost, "x.jpg", "bytes");
  } catch (const alerts::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestSpentScanBudgetWritesNothing() {
  auto fixture = MakeFixture("scan_budget");

  alerts::store::RecordStoreOptions options;
  options.root         = fixture.root;
  options.scan_timeout = std::chrono::milliseconds(0);
  AttachmentRenamer renamer(std::make_shared<RecordStore>(options, std::make_shared<alerts::lock::PathLockTable>(std::chrono::seconds(5))));

  bool timed_out = false;
  try {
    renamer.Attach(fixture.path, "beach.jpg", "bytes");
  } catch (const alerts::util::LockTimeout&) {
    timed_out = true;
  }
  assert(timed_out);
  assert(fs::is_empty(ImagesDir(fixture)));
}

} // namespace

int main() {
  TestNamesFollowAttachOrderAndHideOriginalName();
  TestUnknownExtensionIsCoercedNotRejected();
  TestIdenticalBytesAreDeduplicated();
  TestConcurrentAttachesProduceContiguousNames();
  TestIndexGapDoesNotCollide();
  TestAttachToExpiredRecordLandsInPlace();
  TestAttachToMissingRecordIsNotFound();
  TestSpentScanBudgetWritesNothing();

  std::cout << "alerts_unit_attachment_renamer: pass\n";
  return 0;
}
