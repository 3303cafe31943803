#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/lock/path_lock_table.hpp"
#include "internal/model/alert_record.hpp"
#include "internal/model/record_path.hpp"
#include "internal/util/deadline.hpp"

namespace alerts::store {

struct RecordStoreOptions {
  std::filesystem::path root;

  // Record folders (active + expired) a bucket holds before creates fan
  // out to the next bucket precision.
  uint32_t bucket_capacity = 30000;

  int  max_bucket_precision = 4;
  bool fsync                = false;

  // Budget for one operation's directory scans; past it util::LockTimeout.
  std::chrono::milliseconds scan_timeout{5000};
};

/*
  RecordStore

  Filesystem layout of records under one device's alerts root:

      {bucket}/{active|expired}/{slug}/
        manifest.txt
        images/
        comments/

  Create derives the path and therefore only runs on the authoring device.
  Everything else works on literal RecordPaths.
*/
class RecordStore {
 public:
  RecordStore(RecordStoreOptions options, std::shared_ptr<alerts::lock::PathLockTable> locks);

  // Throws util::InvalidCoordinates, util::SlugCollision.
  alerts::model::RecordPath Create(const alerts::model::AlertRecord& record);

  // Throws util::NotFound.
  alerts::model::AlertRecord Read(const alerts::model::RecordPath& path) const;

  /*
    Renames only the state segment. Moving a record that already sits in
    `to` is a no-op. Throws util::InvalidState for EXPIRED → ACTIVE and
    util::NotFound when the record exists in neither state.
  */
  alerts::model::RecordPath Move(const alerts::model::RecordPath& path, alerts::model::LifecycleState from,
                                 alerts::model::LifecycleState to);

  // Where the record identified by bucket + slug lives now, in either state.
  std::optional<alerts::model::RecordPath> Resolve(const alerts::model::RecordPath& path) const;

  bool Exists(const alerts::model::RecordPath& path) const;

  std::vector<alerts::model::RecordPath> List(std::optional<alerts::model::LifecycleState> state = std::nullopt) const;

  std::size_t BucketOccupancy(const std::string& bucket) const;

  alerts::util::Deadline ScanDeadline() const {
    return alerts::util::Deadline(options_.scan_timeout);
  }

  // Creates {slug}/, images/ and comments/ at a literal path. Used when a
  // replicated record arrives.
  void EnsureSkeleton(const alerts::model::RecordPath& path);

  alerts::lock::PathLockTable::Guard LockRecord(const alerts::model::RecordPath& path) const;

  std::filesystem::path Absolute(const alerts::model::RecordPath& path) const {
    return path.Under(options_.root);
  }

  const std::filesystem::path& Root() const {
    return options_.root;
  }

  bool Fsync() const {
    return options_.fsync;
  }

 private:
  std::string ChooseBucket(const alerts::model::AlertRecord& record, const std::string& slug, const alerts::util::Deadline& deadline) const;
  std::size_t CountOccupancy(const std::string& bucket, const alerts::util::Deadline& deadline) const;
  bool        SlugExists(const std::string& bucket, const std::string& slug) const;

  RecordStoreOptions                           options_;
  std::shared_ptr<alerts::lock::PathLockTable> locks_;
};

} // namespace alerts::store
