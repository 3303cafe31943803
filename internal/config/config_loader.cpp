#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/storage/common/path_grammar.hpp"

namespace alerts::config {

namespace {

constexpr uint32_t kDefaultBucketCapacity      = 30000;
constexpr uint32_t kDefaultMaxBucketPrecision  = 4;
constexpr int64_t  kDefaultTtlSeconds          = 30 * 24 * 60 * 60;
constexpr int64_t  kDefaultSweepSeconds        = 60;
constexpr int64_t  kDefaultLockTimeoutSeconds  = 5;
constexpr uint32_t kDefaultReplicationWorkers  = 4;
constexpr uint32_t kDefaultQueueCapacity       = 256;
constexpr uint32_t kDefaultMaxAttempts         = 5;
constexpr int32_t  kDefaultInitialBackoffNanos = 200 * 1000 * 1000;
constexpr int64_t  kDefaultMaxBackoffSeconds   = 10;
constexpr int32_t  kDefaultPollIntervalNanos   = 500 * 1000 * 1000;

bool IsUnset(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

void SetSeconds(google::protobuf::Duration* d, int64_t seconds) {
  d->set_seconds(seconds);
  d->set_nanos(0);
}

void SetNanos(google::protobuf::Duration* d, int32_t nanos) {
  d->set_seconds(0);
  d->set_nanos(nanos);
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("30s", callsigns made of digits)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

alerts::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  alerts::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);

  if (config.storage().root().empty()) {
    throw std::runtime_error("Invalid configuration: storage.root is required");
  }
  if (config.storage().max_bucket_precision() > 6) {
    throw std::runtime_error("Invalid configuration: storage.max_bucket_precision must be at most 6");
  }
  if (!config.device().callsign().empty() && !alerts::storage::common::IsCallsign(config.device().callsign())) {
    throw std::runtime_error("Invalid configuration: device.callsign must be 1-32 alphanumeric characters");
  }

  return config;
}

void ConfigLoader::ApplyDefaults(alerts::runtime::config::RuntimeConfig* config) {
  auto* storage = config->mutable_storage();
  if (storage->bucket_capacity() == 0) storage->set_bucket_capacity(kDefaultBucketCapacity);
  if (storage->max_bucket_precision() == 0) storage->set_max_bucket_precision(kDefaultMaxBucketPrecision);

  auto* locks = config->mutable_locks();
  if (IsUnset(locks->timeout())) SetSeconds(locks->mutable_timeout(), kDefaultLockTimeoutSeconds);
  if (IsUnset(locks->scan_timeout())) *locks->mutable_scan_timeout() = locks->timeout();

  auto* lifecycle = config->mutable_lifecycle();
  if (IsUnset(lifecycle->default_ttl())) SetSeconds(lifecycle->mutable_default_ttl(), kDefaultTtlSeconds);
  if (IsUnset(lifecycle->sweep_interval())) SetSeconds(lifecycle->mutable_sweep_interval(), kDefaultSweepSeconds);

  auto* replication = config->mutable_replication();
  if (replication->workers() == 0) replication->set_workers(kDefaultReplicationWorkers);
  if (replication->queue_capacity() == 0) replication->set_queue_capacity(kDefaultQueueCapacity);
  if (replication->max_attempts() == 0) replication->set_max_attempts(kDefaultMaxAttempts);
  if (IsUnset(replication->initial_backoff())) SetNanos(replication->mutable_initial_backoff(), kDefaultInitialBackoffNanos);
  if (IsUnset(replication->max_backoff())) SetSeconds(replication->mutable_max_backoff(), kDefaultMaxBackoffSeconds);

  // spool lives beside the alerts root so the replicated tree stays clean
  auto* spool = config->mutable_spool();
  if (!storage->root().empty()) {
    std::string spool_base = storage->root();
    while (spool_base.size() > 1 && spool_base.back() == '/') spool_base.pop_back();
    spool_base += "-spool";
    if (spool->inbox().empty()) spool->set_inbox(spool_base + "/inbox");
    if (spool->outbox().empty()) spool->set_outbox(spool_base + "/outbox");
  }
  if (IsUnset(spool->poll_interval())) SetNanos(spool->mutable_poll_interval(), kDefaultPollIntervalNanos);
}

} // namespace alerts::config
