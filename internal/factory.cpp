#include "factory.hpp"

#include <stdexcept>

#include "internal/util/time.hpp"

namespace alerts::factory {

RuntimeDependencies BuildRuntime(const alerts::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  deps.locks = std::make_shared<lock::PathLockTable>(alerts::util::FromProto(config.locks().timeout()));

  store::RecordStoreOptions options;
  options.root                 = config.storage().root();
  options.bucket_capacity      = config.storage().bucket_capacity();
  options.max_bucket_precision = static_cast<int>(config.storage().max_bucket_precision());
  options.fsync                = config.storage().fsync();
  options.scan_timeout         = alerts::util::FromProto(config.locks().scan_timeout());

  deps.store       = std::make_shared<store::RecordStore>(options, deps.locks);
  deps.attachments = std::make_shared<store::AttachmentRenamer>(deps.store);
  deps.comments    = std::make_shared<comments::CommentLedger>(deps.store);

  const auto ttl = std::chrono::duration_cast<std::chrono::seconds>(alerts::util::FromProto(config.lifecycle().default_ttl()));
  deps.lifecycle = std::make_shared<lifecycle::LifecycleManager>(deps.store, ttl, config.device().callsign());

  deps.replicator = std::make_shared<sync::SyncReplicator>(deps.store);

  // ------------------------------------------------------------------
  // Spool
  // ------------------------------------------------------------------
  deps.inbox  = std::make_shared<spool::Spool>(config.spool().inbox(), config.storage().fsync());
  deps.outbox = std::make_shared<spool::Spool>(config.spool().outbox(), config.storage().fsync());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.callsign    = config.device().callsign();
  ctx.store       = deps.store;
  ctx.attachments = deps.attachments;
  ctx.comments    = deps.comments;
  ctx.lifecycle   = deps.lifecycle;
  ctx.outbox      = deps.outbox;

  deps.authoring = std::make_shared<service::AuthoringService>(std::move(ctx));

  return deps;
}

sync::ReplicationPoolOptions PoolOptionsFromConfig(const alerts::runtime::config::RuntimeConfig& config) {
  const auto& replication = config.replication();

  sync::ReplicationPoolOptions options;
  options.workers         = replication.workers();
  options.queue_capacity  = replication.queue_capacity();
  options.max_attempts    = replication.max_attempts();
  options.initial_backoff = alerts::util::FromProto(replication.initial_backoff());
  options.max_backoff     = alerts::util::FromProto(replication.max_backoff());
  return options;
}

} // namespace alerts::factory
