#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/comments/comment_ledger.hpp"
#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/lock/path_lock_table.hpp"
#include "internal/service/authoring_service.hpp"
#include "internal/spool/spool.hpp"
#include "internal/store/attachment_renamer.hpp"
#include "internal/store/record_store.hpp"
#include "internal/sync/replication_pool.hpp"
#include "internal/sync/sync_replicator.hpp"

namespace alerts::factory {

/*
  RuntimeDependencies

  Owns all long-lived components of one device's alerts root.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<lock::PathLockTable> locks;

  std::shared_ptr<store::RecordStore>          store;
  std::shared_ptr<store::AttachmentRenamer>    attachments;
  std::shared_ptr<comments::CommentLedger>     comments;
  std::shared_ptr<lifecycle::LifecycleManager> lifecycle;
  std::shared_ptr<sync::SyncReplicator>        replicator;

  std::shared_ptr<spool::Spool> inbox;
  std::shared_ptr<spool::Spool> outbox;

  std::shared_ptr<service::AuthoringService> authoring;
};

/*
  BuildRuntime

  Composition root. Expects a config that went through
  ConfigLoader::ApplyDefaults.
*/
RuntimeDependencies BuildRuntime(const alerts::runtime::config::RuntimeConfig& config);

sync::ReplicationPoolOptions PoolOptionsFromConfig(const alerts::runtime::config::RuntimeConfig& config);

} // namespace alerts::factory
