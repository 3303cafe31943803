#include "internal/service/authoring_service.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/storage/common/path_grammar.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/uuid.hpp"

namespace {

using alerts::model::LifecycleState;
using alerts::model::RecordPath;

namespace fs = std::filesystem;

alerts::factory::RuntimeDependencies MakeRuntime(const std::string& name) {
  const auto base = fs::temp_directory_path() / "alerts_authoring_service_tests" / name;
  fs::remove_all(base);

  alerts::runtime::config::RuntimeConfig config;
  config.mutable_device()->set_callsign("X13K0G");
  config.mutable_storage()->set_root((base / "alerts").string());
  alerts::config::ConfigLoader::ApplyDefaults(&config);

  return alerts::factory::BuildRuntime(config);
}

alerts::model::AlertRecord MakeRecord(const std::string& title, const std::string& created) {
  alerts::model::AlertRecord record;
  record.title       = title;
  record.body        = "Smoke visible from the bridge.";
  record.created_at  = alerts::util::ParseIso8601(created);
  record.coordinates = {38.7223, -9.1393};
  return record;
}

void TestCreatePublishesManifestPayload() {
  auto deps = MakeRuntime("create");

  const auto payload = deps.authoring->CreateRecord(MakeRecord("Test Alert With Photos", "2025-12-14T15:32:00Z"));
  assert(alerts::util::IsCanonicalUUID(payload.id()));
  assert(payload.kind() == alerts::v1::PAYLOAD_KIND_RECORD);
  assert(payload.path() == "38.7_-9.1/active/2025-12-14_15-32_test-alert-with-photos");
  assert(payload.file_name() == "manifest.txt");
  assert(payload.content_hash() == alerts::util::Sha256Hex(payload.content()));

  // author defaults to the device callsign
  assert(payload.content().find("AUTHOR: X13K0G\n") != std::string::npos);

  const auto pending = deps.outbox->Pending();
  assert(pending.size() == 1);
  assert(pending[0].filename() == payload.id() + ".syncpb");
  assert(deps.outbox->Load(pending[0]).SerializeAsString() == payload.SerializeAsString());
}

void TestAttachAndCommentPublishDecidedNames() {
  auto deps = MakeRuntime("artifacts");

  const auto record = deps.authoring->CreateRecord(MakeRecord("Fire", "2025-12-14T15:32:00Z"));
  const auto path   = alerts::storage::common::ParseRecordPath(record.path());

  const auto photo = deps.authoring->Attach(path, "DSC_0042.JPG", "jpeg-bytes");
  assert(photo.attach.file_name == "photo1.jpg");
  assert(photo.payload.kind() == alerts::v1::PAYLOAD_KIND_ATTACHMENT);
  assert(photo.payload.file_name() == "photo1.jpg");
  assert(photo.payload.content() == "jpeg-bytes");

  alerts::model::Comment comment;
  comment.created_at = alerts::util::ParseIso8601("2025-12-14T21:15:23Z");
  comment.body       = "Firefighters on site";

  const auto posted = deps.authoring->AddComment(path, comment);
  assert(posted.kind() == alerts::v1::PAYLOAD_KIND_COMMENT);
  assert(posted.file_name() == "2025-12-14_21-15-23_X13K0G.txt");
  assert(posted.content() == "> 2025-12-14 21:15_23 -- X13K0G\nFirefighters on site\n");

  assert(deps.outbox->Pending().size() == 3);
}

void TestLifecyclePayloadCarriesPreviousPath() {
  auto deps = MakeRuntime("lifecycle");

  const auto record = deps.authoring->CreateRecord(MakeRecord("Fire", "2025-12-14T15:32:00Z"));
  const auto path   = alerts::storage::common::ParseRecordPath(record.path());

  const auto closed = deps.authoring->Close(path);
  assert(closed);
  assert(closed->kind() == alerts::v1::PAYLOAD_KIND_LIFECYCLE);
  assert(closed->path() == "38.7_-9.1/expired/2025-12-14_15-32_fire");
  assert(closed->header().at("from") == record.path());
  assert(closed->header().at("reason") == "closed");
  assert(closed->content().empty());

  deps.authoring->CreateRecord(MakeRecord("Old", "2020-01-01T00:00:00Z"));
  const auto swept = deps.authoring->Sweep(alerts::util::Now());
  assert(swept.size() == 1);
  assert(swept[0].header().at("reason") == "ttl");
  assert(deps.store->List(LifecycleState::kActive).empty());
}

void TestRepeatedCloseAndExpirePublishNothing() {
  auto deps = MakeRuntime("lifecycle_repeat");

  const auto record = deps.authoring->CreateRecord(MakeRecord("Fire", "2020-01-01T00:00:00Z"));
  const auto path   = alerts::storage::common::ParseRecordPath(record.path());

  assert(deps.authoring->Close(path));
  const auto spooled = deps.outbox->Pending().size();
  assert(spooled == 2);

  assert(!deps.authoring->Close(path));
  assert(!deps.authoring->Expire(path, alerts::util::Now()));
  assert(!deps.authoring->Expire(path.WithState(LifecycleState::kExpired), alerts::util::Now()));
  assert(deps.outbox->Pending().size() == spooled);
}

void TestSpoolRejectsBadInput() {
  auto deps = MakeRuntime("spool");

  alerts::v1::SyncPayload payload;
  payload.set_id("../../escape");

  bool threw = false;
  try {
    deps.outbox->Put(payload);
  } catch (const alerts::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  const auto garbage = deps.inbox->Dir() / (alerts::util::NewPayloadId() + ".syncpb");
  alerts::storage::WriteFileAtomic(garbage, std::string("\xff\xff\xff\xff", 4), false);
  assert(deps.inbox->Pending().size() == 1);

  bool malformed = false;
  try {
    (void)deps.inbox->Load(garbage);
  } catch (const alerts::util::InvalidState&) {
    malformed = true;
  }
  assert(malformed);

  const auto moved = deps.inbox->Reject(garbage);
  assert(fs::exists(moved));
  assert(deps.inbox->Pending().empty());
}

} // namespace

int main() {
  TestCreatePublishesManifestPayload();
  TestAttachAndCommentPublishDecidedNames();
  TestLifecyclePayloadCarriesPreviousPath();
  TestRepeatedCloseAndExpirePublishNothing();
  TestSpoolRejectsBadInput();

  std::cout << "alerts_unit_authoring_service: pass\n";
  return 0;
}
