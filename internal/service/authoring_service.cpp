#include "authoring_service.hpp"

#include "internal/comments/comment_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/spool/spool.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/storage/common/path_grammar.hpp"
#include "internal/store/record_store.hpp"
#include "internal/sync/sync_replicator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/uuid.hpp"

namespace alerts::service {

using alerts::model::RecordPath;
using alerts::observability::StringField;

namespace common = alerts::storage::common;

namespace {

alerts::v1::SyncPayload MakePayload(alerts::v1::PayloadKind kind, const RecordPath& path, std::string file_name, std::string content) {
  alerts::v1::SyncPayload payload;
  payload.set_id(alerts::util::NewPayloadId());
  payload.set_kind(kind);
  payload.set_path(path.ToString());
  payload.set_content_hash(alerts::util::Sha256Hex(content));
  payload.set_file_name(std::move(file_name));
  payload.set_content(std::move(content));
  return payload;
}

} // namespace

AuthoringService::AuthoringService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

alerts::v1::SyncPayload AuthoringService::Publish(alerts::v1::SyncPayload payload) {
  if (ctx_.outbox) {
    ctx_.outbox->Put(payload);
  }
  ALERTS_LOG_DEBUG("Payload published", {StringField("id", payload.id()), StringField("kind", alerts::v1::PayloadKind_Name(payload.kind())),
                                         StringField("path", payload.path())});
  return payload;
}

alerts::v1::SyncPayload AuthoringService::CreateRecord(alerts::model::AlertRecord record) {
  if (record.author.empty()) record.author = ctx_.callsign;

  const RecordPath path     = ctx_.store->Create(record);
  const auto       manifest = alerts::storage::ReadFile(ctx_.store->Absolute(path) / std::string(common::kManifestFileName));

  return Publish(MakePayload(alerts::v1::PAYLOAD_KIND_RECORD, path, std::string(common::kManifestFileName), manifest));
}

AttachResponse AuthoringService::Attach(const RecordPath& path, std::string_view original_file_name, std::string_view bytes) {
  AttachResponse response;
  response.attach = ctx_.attachments->Attach(path, original_file_name, bytes);

  const RecordPath current = ctx_.store->Resolve(path).value_or(path);
  response.payload = Publish(MakePayload(alerts::v1::PAYLOAD_KIND_ATTACHMENT, current, response.attach.file_name, std::string(bytes)));
  return response;
}

alerts::v1::SyncPayload AuthoringService::AddComment(const RecordPath& path, alerts::model::Comment comment) {
  if (comment.author.empty()) comment.author = ctx_.callsign;

  const auto file_name = ctx_.comments->Append(path, comment);

  const auto current = ctx_.store->Resolve(path);
  if (!current) throw alerts::util::NotFound("record not found: " + path.ToString());

  const auto content =
      alerts::storage::ReadFile(ctx_.store->Absolute(*current) / std::string(common::kCommentsDir) / file_name);
  return Publish(MakePayload(alerts::v1::PAYLOAD_KIND_COMMENT, *current, file_name, content));
}

alerts::v1::SyncPayload AuthoringService::PublishLifecycle(const alerts::lifecycle::LifecycleChange& change) {
  alerts::v1::SyncPayload payload;
  payload.set_id(alerts::util::NewPayloadId());
  payload.set_kind(alerts::v1::PAYLOAD_KIND_LIFECYCLE);
  payload.set_path(change.to.ToString());
  (*payload.mutable_header())[std::string(alerts::sync::kHeaderFrom)]   = change.from.ToString();
  (*payload.mutable_header())[std::string(alerts::sync::kHeaderReason)] = change.reason;
  return Publish(std::move(payload));
}

std::optional<alerts::v1::SyncPayload> AuthoringService::PublishIfMoved(const alerts::lifecycle::LifecycleChange& change) {
  if (!change.Moved()) {
    ALERTS_LOG_DEBUG("Record already expired, nothing to publish", {StringField("path", change.to.ToString())});
    return std::nullopt;
  }
  return PublishLifecycle(change);
}

std::optional<alerts::v1::SyncPayload> AuthoringService::Expire(const RecordPath& path, alerts::util::TimePoint now) {
  return PublishIfMoved(ctx_.lifecycle->Expire(path, now));
}

std::optional<alerts::v1::SyncPayload> AuthoringService::Close(const RecordPath& path) {
  return PublishIfMoved(ctx_.lifecycle->Close(path, ctx_.callsign));
}

std::vector<alerts::v1::SyncPayload> AuthoringService::Sweep(alerts::util::TimePoint now) {
  std::vector<alerts::v1::SyncPayload> out;
  for (const auto& change : ctx_.lifecycle->Sweep(now)) {
    out.push_back(PublishLifecycle(change));
  }
  return out;
}

} // namespace alerts::service
