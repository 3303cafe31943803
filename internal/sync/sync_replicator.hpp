#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "alerts/v1/sync.pb.h"
#include "internal/model/record_path.hpp"

namespace alerts::store {
class RecordStore;
}

namespace alerts::util {
class CancellationToken;
}

namespace alerts::sync {

// SyncPayload.header keys of lifecycle payloads.
inline constexpr std::string_view kHeaderFrom   = "from";
inline constexpr std::string_view kHeaderReason = "reason";

inline constexpr std::string_view kConflictInfix = ".conflict-";

enum class ApplyOutcome {
  kWritten,
  kNoop,
  kConflict,
};

std::string_view ToString(ApplyOutcome outcome);

struct ApplyResult {
  ApplyOutcome              outcome = ApplyOutcome::kNoop;
  alerts::model::RecordPath target;

  // set for kConflict: where the incoming bytes were preserved
  std::filesystem::path conflict_path;
};

/*
  SyncReplicator

  Applies a payload produced elsewhere at exactly the path and file name it
  carries. Names are only checked against the path grammar, never derived:
  a replica must reproduce the origin's tree even when its own naming would
  have chosen differently.

  Idempotent: identical bytes already on disk are a no-op. Different bytes
  at the same name are never overwritten; the incoming copy is kept beside
  the original as {fileName}.conflict-{hash8}.
*/
class SyncReplicator {
 public:
  explicit SyncReplicator(std::shared_ptr<alerts::store::RecordStore> store);

  /*
    Throws:
      util::PathTraversalRejected  path or file name outside the grammar
      util::ContentHashMismatch    content_hash does not match the bytes
      util::NotFound               record not present yet (retryable)
      util::Cancelled              cancelled between steps
  */
  ApplyResult Apply(const alerts::v1::SyncPayload& payload, const alerts::util::CancellationToken* cancel = nullptr);

 private:
  ApplyResult ApplyRecord(const alerts::model::RecordPath& path, const alerts::v1::SyncPayload& payload,
                          const std::string& hash, const alerts::util::CancellationToken* cancel);

  ApplyResult ApplyFile(const alerts::model::RecordPath& path, std::string_view directory, const alerts::v1::SyncPayload& payload,
                        const std::string& hash, const alerts::util::CancellationToken* cancel);

  ApplyResult ApplyLifecycle(const alerts::model::RecordPath& path, const alerts::v1::SyncPayload& payload,
                             const alerts::util::CancellationToken* cancel);

  // Writes bytes at target unless a file is already there; compares otherwise.
  ApplyResult WriteOrCompare(const alerts::model::RecordPath& record, const std::filesystem::path& target,
                             const alerts::v1::SyncPayload& payload, const std::string& hash,
                             const alerts::util::CancellationToken* cancel);

  std::shared_ptr<alerts::store::RecordStore> store_;
};

} // namespace alerts::sync
