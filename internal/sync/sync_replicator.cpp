#include "sync_replicator.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/storage/common/path_grammar.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace alerts::sync {

using alerts::model::LifecycleState;
using alerts::model::RecordPath;
using alerts::observability::StringField;

namespace fs     = std::filesystem;
namespace common = alerts::storage::common;

namespace {

constexpr std::size_t kHashPrefixLength = 8;

bool IsHexSha256(const std::string& value) {
  return value.size() == 64 &&
         std::all_of(value.begin(), value.end(), [](char c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
}

std::string KindName(alerts::v1::PayloadKind kind) {
  return alerts::v1::PayloadKind_Name(kind);
}

} // namespace

std::string_view ToString(ApplyOutcome outcome) {
  switch (outcome) {
    case ApplyOutcome::kWritten:
      return "written";
    case ApplyOutcome::kNoop:
      return "noop";
    case ApplyOutcome::kConflict:
      return "conflict";
  }
  return "unknown";
}

SyncReplicator::SyncReplicator(std::shared_ptr<alerts::store::RecordStore> store) : store_(std::move(store)) {
}

ApplyResult SyncReplicator::Apply(const alerts::v1::SyncPayload& payload, const alerts::util::CancellationToken* cancel) {
  if (cancel) cancel->ThrowIfCancelled("apply " + payload.id());

  const RecordPath path = common::ParseRecordPath(payload.path());

  if (payload.kind() == alerts::v1::PAYLOAD_KIND_LIFECYCLE) {
    return ApplyLifecycle(path, payload, cancel);
  }

  const std::string hash = alerts::util::Sha256Hex(payload.content());
  if (!payload.content_hash().empty()) {
    if (!IsHexSha256(payload.content_hash()) || payload.content_hash() != hash) {
      throw alerts::util::ContentHashMismatch("content hash mismatch for " + payload.path() + "/" + payload.file_name());
    }
  }

  switch (payload.kind()) {
    case alerts::v1::PAYLOAD_KIND_RECORD:
      return ApplyRecord(path, payload, hash, cancel);
    case alerts::v1::PAYLOAD_KIND_ATTACHMENT:
      return ApplyFile(path, common::kImagesDir, payload, hash, cancel);
    case alerts::v1::PAYLOAD_KIND_COMMENT:
      return ApplyFile(path, common::kCommentsDir, payload, hash, cancel);
    default:
      throw alerts::util::InvalidState("unsupported payload kind: " + KindName(payload.kind()));
  }
}

ApplyResult SyncReplicator::ApplyRecord(const RecordPath& path, const alerts::v1::SyncPayload& payload, const std::string& hash,
                                        const alerts::util::CancellationToken* cancel) {
  const std::string file_name = payload.file_name().empty() ? std::string(common::kManifestFileName) : payload.file_name();
  common::ValidateFileName("", file_name);

  auto guard = store_->LockRecord(path);

  // a record that expired here before the manifest was resent stays expired
  const RecordPath target = store_->Resolve(path).value_or(path);
  store_->EnsureSkeleton(target);

  if (cancel) cancel->ThrowIfCancelled("apply " + payload.id());
  return WriteOrCompare(target, store_->Absolute(target) / file_name, payload, hash, cancel);
}

ApplyResult SyncReplicator::ApplyFile(const RecordPath& path, std::string_view directory, const alerts::v1::SyncPayload& payload,
                                      const std::string& hash, const alerts::util::CancellationToken* cancel) {
  common::ValidateFileName(directory, payload.file_name());

  auto guard = store_->LockRecord(path);

  // comments and photos may arrive after the record expired on this device
  const auto current = store_->Resolve(path);
  if (!current) {
    throw alerts::util::NotFound("record not present yet: " + path.ToString());
  }

  const auto dir = store_->Absolute(*current) / std::string(directory);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw alerts::util::IOError("create " + dir.string() + " failed: " + ec.message());

  if (cancel) cancel->ThrowIfCancelled("apply " + payload.id());
  return WriteOrCompare(*current, dir / payload.file_name(), payload, hash, cancel);
}

ApplyResult SyncReplicator::ApplyLifecycle(const RecordPath& path, const alerts::v1::SyncPayload& payload,
                                           const alerts::util::CancellationToken* cancel) {
  RecordPath from = path.WithState(LifecycleState::kActive);

  const auto it = payload.header().find(std::string(kHeaderFrom));
  if (it != payload.header().end()) {
    from = common::ParseRecordPath(it->second);
  }
  if (from.Key() != path.Key()) {
    throw alerts::util::InvalidState("lifecycle payload changes identity: " + from.ToString() + " -> " + path.ToString());
  }

  if (cancel) cancel->ThrowIfCancelled("apply " + payload.id());

  ApplyResult result;
  result.target = path;

  if (store_->Exists(path)) {
    result.outcome = ApplyOutcome::kNoop;
    return result;
  }
  if (!store_->Exists(from)) {
    throw alerts::util::NotFound("record not present yet: " + from.ToString());
  }

  store_->Move(from, from.state, path.state);
  result.outcome = ApplyOutcome::kWritten;

  ALERTS_LOG_INFO("Replicated lifecycle change",
                  {StringField("id", payload.id()), StringField("from", from.ToString()), StringField("to", path.ToString())});
  return result;
}

ApplyResult SyncReplicator::WriteOrCompare(const RecordPath& record, const fs::path& target, const alerts::v1::SyncPayload& payload,
                                           const std::string& hash, const alerts::util::CancellationToken* cancel) {
  ApplyResult result;
  result.target = record;

  std::error_code ec;
  if (!fs::exists(target, ec)) {
    alerts::storage::WriteFileAtomic(target, payload.content(), store_->Fsync(), cancel);
    result.outcome = ApplyOutcome::kWritten;

    ALERTS_LOG_DEBUG("Replicated file", {StringField("id", payload.id()), StringField("file", target.string())});
    return result;
  }

  if (alerts::util::Sha256Hex(alerts::storage::ReadFile(target)) == hash) {
    result.outcome = ApplyOutcome::kNoop;
    return result;
  }

  result.outcome       = ApplyOutcome::kConflict;
  result.conflict_path = target.parent_path() / (target.filename().string() + std::string(kConflictInfix) + hash.substr(0, kHashPrefixLength));

  if (!fs::exists(result.conflict_path, ec)) {
    alerts::storage::WriteFileAtomic(result.conflict_path, payload.content(), store_->Fsync(), cancel);
  }

  ALERTS_LOG_ERROR("Conflicting content for replicated file", {StringField("id", payload.id()), StringField("kind", KindName(payload.kind())),
                                                               StringField("file", target.string()),
                                                               StringField("preserved_as", result.conflict_path.filename().string())});
  return result;
}

} // namespace alerts::sync
