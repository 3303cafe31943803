#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "alerts/v1/sync.pb.h"
#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/model/alert_record.hpp"
#include "internal/model/record_path.hpp"
#include "internal/store/attachment_renamer.hpp"
#include "internal/util/time.hpp"
#include "service_context.hpp"

namespace alerts::service {

struct AttachResponse {
  alerts::store::AttachResult attach;
  alerts::v1::SyncPayload     payload;
};

/*
  AuthoringService

  Local-origin operations. This is the only place the generative naming
  runs (path derivation, photo numbering, comment sequencing); each call
  returns the SyncPayload carrying the decided literal path and file name,
  and spools it into the outbox when one is configured.
*/
class AuthoringService {
 public:
  explicit AuthoringService(ServiceContext ctx);

  // An empty author defaults to the local callsign.
  alerts::v1::SyncPayload CreateRecord(alerts::model::AlertRecord record);

  AttachResponse Attach(const alerts::model::RecordPath& path, std::string_view original_file_name, std::string_view bytes);

  alerts::v1::SyncPayload AddComment(const alerts::model::RecordPath& path, alerts::model::Comment comment);

  // Expire and Close publish nothing (nullopt) for an already expired record.
  std::optional<alerts::v1::SyncPayload> Expire(const alerts::model::RecordPath& path, alerts::util::TimePoint now);

  // Closes on behalf of the local callsign.
  std::optional<alerts::v1::SyncPayload> Close(const alerts::model::RecordPath& path);

  std::vector<alerts::v1::SyncPayload> Sweep(alerts::util::TimePoint now);

  alerts::v1::SyncPayload PublishLifecycle(const alerts::lifecycle::LifecycleChange& change);

  const ServiceContext& Context() const {
    return ctx_;
  }

 private:
  alerts::v1::SyncPayload                Publish(alerts::v1::SyncPayload payload);
  std::optional<alerts::v1::SyncPayload> PublishIfMoved(const alerts::lifecycle::LifecycleChange& change);

  ServiceContext ctx_;
};

} // namespace alerts::service
