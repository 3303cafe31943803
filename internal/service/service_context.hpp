#pragma once

#include <memory>
#include <string>

namespace alerts::store {
class RecordStore;
class AttachmentRenamer;
} // namespace alerts::store
namespace alerts::comments { class CommentLedger; }
namespace alerts::lifecycle { class LifecycleManager; }
namespace alerts::spool { class Spool; }

namespace alerts::service {

/*
  Dependency container shared by the services.
*/
struct ServiceContext {
  // local device identity
  std::string callsign;

  std::shared_ptr<alerts::store::RecordStore>         store;
  std::shared_ptr<alerts::store::AttachmentRenamer>   attachments;
  std::shared_ptr<alerts::comments::CommentLedger>    comments;
  std::shared_ptr<alerts::lifecycle::LifecycleManager> lifecycle;

  // optional; payloads are only returned when unset
  std::shared_ptr<alerts::spool::Spool> outbox;
};

} // namespace alerts::service
