#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/alert_record.hpp"
#include "internal/model/record_path.hpp"
#include "internal/util/time.hpp"

namespace alerts::store {
class RecordStore;
}

namespace alerts::lifecycle {

// Manifest metadata key overriding the configured TTL, in seconds.
inline constexpr std::string_view kTtlMetadataKey = "ttl";

inline constexpr std::string_view kReasonTtl    = "ttl";
inline constexpr std::string_view kReasonClosed = "closed";

struct LifecycleChange {
  alerts::model::RecordPath from;
  alerts::model::RecordPath to;
  std::string               reason;

  bool Moved() const {
    return from != to;
  }
};

/*
  LifecycleManager

  ACTIVE → EXPIRED when now >= createdAt + ttl, or when the author closes
  the alert. EXPIRED is terminal. Only records authored by local_author
  are ever moved here; replicas change state through SyncReplicator.
  The change returned carries the literal new path for replication.
*/
class LifecycleManager {
 public:
  LifecycleManager(std::shared_ptr<alerts::store::RecordStore> store, std::chrono::seconds default_ttl, std::string local_author);

  alerts::util::TimePoint ExpiresAt(const alerts::model::AlertRecord& record) const;
  bool                    IsDue(const alerts::model::AlertRecord& record, alerts::util::TimePoint now) const;

  bool AuthoredHere(const alerts::model::AlertRecord& record) const {
    return !local_author_.empty() && record.author == local_author_;
  }

  // Throws util::PermissionDenied for records authored elsewhere and
  // util::InvalidState when the record is not due yet.
  LifecycleChange Expire(const alerts::model::RecordPath& path, alerts::util::TimePoint now);

  // Explicit close; throws util::PermissionDenied unless requester is the author.
  LifecycleChange Close(const alerts::model::RecordPath& path, const std::string& requester);

  // Expires every due active record authored here. Failures are logged per record.
  std::vector<LifecycleChange> Sweep(alerts::util::TimePoint now);

 private:
  LifecycleChange MoveToExpired(const alerts::model::RecordPath& path, std::string_view reason);

  std::shared_ptr<alerts::store::RecordStore> store_;
  std::chrono::seconds                        default_ttl_;
  std::string                                 local_author_;
};

} // namespace alerts::lifecycle
