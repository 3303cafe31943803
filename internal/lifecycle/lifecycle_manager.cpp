#include "lifecycle_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/errors.hpp"

namespace alerts::lifecycle {

using alerts::model::LifecycleState;
using alerts::model::RecordPath;
using alerts::observability::IntField;
using alerts::observability::StringField;

LifecycleManager::LifecycleManager(std::shared_ptr<alerts::store::RecordStore> store, std::chrono::seconds default_ttl,
                                   std::string local_author)
    : store_(std::move(store)), default_ttl_(default_ttl), local_author_(std::move(local_author)) {
}

alerts::util::TimePoint LifecycleManager::ExpiresAt(const alerts::model::AlertRecord& record) const {
  auto ttl = default_ttl_;
  for (const auto& [key, value] : record.metadata) {
    if (key != kTtlMetadataKey) continue;
    try {
      ttl = std::chrono::seconds(std::stoll(value));
    } catch (const std::exception&) {
      ALERTS_LOG_WARN("Ignoring malformed ttl metadata", {StringField("value", value)});
    }
  }
  return record.created_at + ttl;
}

bool LifecycleManager::IsDue(const alerts::model::AlertRecord& record, alerts::util::TimePoint now) const {
  return now >= ExpiresAt(record);
}

LifecycleChange LifecycleManager::MoveToExpired(const RecordPath& path, std::string_view reason) {
  LifecycleChange change;
  change.from   = path;
  change.to     = store_->Move(path, path.state, LifecycleState::kExpired);
  change.reason = std::string(reason);
  return change;
}

LifecycleChange LifecycleManager::Expire(const RecordPath& path, alerts::util::TimePoint now) {
  const auto current = store_->Resolve(path);
  if (!current) {
    throw alerts::util::NotFound("record not found: " + path.ToString());
  }
  if (current->state == LifecycleState::kExpired) {
    return LifecycleChange{*current, *current, std::string(kReasonTtl)};
  }

  const auto record = store_->Read(*current);
  if (!AuthoredHere(record)) {
    throw alerts::util::PermissionDenied("only the author may expire " + current->ToString());
  }
  if (!IsDue(record, now)) {
    throw alerts::util::InvalidState("record not due until " + alerts::util::FormatIso8601(ExpiresAt(record)) + ": " +
                                     current->ToString());
  }
  return MoveToExpired(*current, kReasonTtl);
}

LifecycleChange LifecycleManager::Close(const RecordPath& path, const std::string& requester) {
  const auto current = store_->Resolve(path);
  if (!current) {
    throw alerts::util::NotFound("record not found: " + path.ToString());
  }

  const auto record = store_->Read(*current);
  if (record.author != requester) {
    throw alerts::util::PermissionDenied("only the author may close " + current->ToString());
  }
  if (current->state == LifecycleState::kExpired) {
    return LifecycleChange{*current, *current, std::string(kReasonClosed)};
  }
  return MoveToExpired(*current, kReasonClosed);
}

std::vector<LifecycleChange> LifecycleManager::Sweep(alerts::util::TimePoint now) {
  std::vector<LifecycleChange> changes;
  std::size_t                  foreign = 0;

  for (const auto& path : store_->List(LifecycleState::kActive)) {
    try {
      const auto record = store_->Read(path);
      if (!AuthoredHere(record)) {
        ++foreign;
        continue;
      }
      if (!IsDue(record, now)) continue;
      changes.push_back(MoveToExpired(path, kReasonTtl));
    } catch (const std::exception& e) {
      ALERTS_LOG_ERROR("Expiry failed", {StringField("path", path.ToString()), StringField("error", e.what())});
    }
  }

  if (!changes.empty()) {
    ALERTS_LOG_INFO("Lifecycle sweep", {IntField("expired", static_cast<int64_t>(changes.size()))});
  }
  if (foreign > 0) {
    ALERTS_LOG_DEBUG("Lifecycle sweep left replicated records to their author", {IntField("records", static_cast<int64_t>(foreign))});
  }
  return changes;
}

} // namespace alerts::lifecycle
