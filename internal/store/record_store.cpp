#include "record_store.hpp"

#include <algorithm>
#include <system_error>

#include "internal/naming/path_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/storage/common/path_grammar.hpp"
#include "internal/store/manifest.hpp"
#include "internal/util/errors.hpp"

namespace alerts::store {

using alerts::model::AlertRecord;
using alerts::model::LifecycleState;
using alerts::model::RecordPath;
using alerts::observability::IntField;
using alerts::observability::StringField;

namespace fs = std::filesystem;

namespace {

constexpr LifecycleState kAllStates[] = {LifecycleState::kActive, LifecycleState::kExpired};

std::size_t CountRecordDirs(const fs::path& dir, const alerts::util::Deadline& deadline) {
  deadline.Check("scan of " + dir.string());

  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return 0;

  std::size_t count = 0;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    deadline.Check("scan of " + dir.string());
    if (it->is_directory(ec) && alerts::storage::common::IsRecordSlug(it->path().filename().string())) {
      ++count;
    }
  }
  if (ec) throw alerts::util::IOError("listing " + dir.string() + " failed: " + ec.message());
  return count;
}

void CreateDirectoryOrThrow(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw alerts::util::IOError("create " + dir.string() + " failed: " + ec.message());
}

} // namespace

RecordStore::RecordStore(RecordStoreOptions options, std::shared_ptr<alerts::lock::PathLockTable> locks)
    : options_(std::move(options)), locks_(std::move(locks)) {
  if (options_.max_bucket_precision < alerts::naming::kMinPrecision || options_.max_bucket_precision > alerts::naming::kMaxPrecision) {
    throw std::invalid_argument("max_bucket_precision out of range");
  }
  CreateDirectoryOrThrow(options_.root);
}

bool RecordStore::SlugExists(const std::string& bucket, const std::string& slug) const {
  std::error_code ec;
  for (auto state : kAllStates) {
    if (fs::exists(options_.root / bucket / std::string(alerts::model::ToString(state)) / slug, ec)) return true;
  }
  return false;
}

std::size_t RecordStore::BucketOccupancy(const std::string& bucket) const {
  return CountOccupancy(bucket, ScanDeadline());
}

std::size_t RecordStore::CountOccupancy(const std::string& bucket, const alerts::util::Deadline& deadline) const {
  std::size_t total = 0;
  for (auto state : kAllStates) {
    total += CountRecordDirs(options_.root / bucket / std::string(alerts::model::ToString(state)), deadline);
  }
  return total;
}

/*
  Fan-out rule, identical on every device:
    try precision 1, 2, ... max; take the first bucket below capacity.
  A slug already present in any bucket on the way is a duplicate.
*/
std::string RecordStore::ChooseBucket(const AlertRecord& record, const std::string& slug, const alerts::util::Deadline& deadline) const {
  std::string bucket;
  for (int precision = alerts::naming::kMinPrecision; precision <= options_.max_bucket_precision; ++precision) {
    bucket = alerts::naming::BucketName(record.coordinates, precision);

    if (SlugExists(bucket, slug)) {
      throw alerts::util::SlugCollision("record already exists: " + bucket + "/*/" + slug);
    }

    const auto occupancy = CountOccupancy(bucket, deadline);
    if (occupancy < options_.bucket_capacity) {
      return bucket;
    }

    ALERTS_LOG_INFO("Bucket full, fanning out", {StringField("bucket", bucket), IntField("occupancy", static_cast<int64_t>(occupancy))});
  }

  ALERTS_LOG_WARN("All bucket precisions full, using finest", {StringField("bucket", bucket)});
  return bucket;
}

RecordPath RecordStore::Create(const AlertRecord& input) {
  alerts::naming::ValidateCoordinates(input.coordinates);

  AlertRecord record = input;
  record.created_at  = alerts::util::TruncateToSecond(record.created_at);
  record.state       = LifecycleState::kActive;

  // format first so a bad title/author never leaves a directory behind
  const std::string manifest = FormatManifest(record);
  const std::string slug     = alerts::naming::RecordSlug(record.created_at, record.title);

  // creates in one area serialize on the primary bucket
  const auto primary = alerts::naming::BucketName(record.coordinates);
  CreateDirectoryOrThrow(options_.root / primary);
  auto bucket_lock = locks_->Acquire("create:" + primary, options_.root / primary);

  RecordPath path;
  // one budget for every precision level tried
  path.bucket = ChooseBucket(record, slug, ScanDeadline());
  path.state  = LifecycleState::kActive;
  path.slug   = slug;

  const auto dir = Absolute(path);
  CreateDirectoryOrThrow(dir.parent_path());

  std::error_code ec;
  if (!fs::create_directory(dir, ec)) {
    if (ec) throw alerts::util::IOError("create " + dir.string() + " failed: " + ec.message());
    throw alerts::util::SlugCollision("record already exists: " + path.ToString());
  }

  try {
    CreateDirectoryOrThrow(dir / std::string(alerts::storage::common::kImagesDir));
    CreateDirectoryOrThrow(dir / std::string(alerts::storage::common::kCommentsDir));
    alerts::storage::WriteFileAtomic(dir / std::string(alerts::storage::common::kManifestFileName), manifest, options_.fsync);
  } catch (...) {
    std::error_code cleanup_ec;
    fs::remove_all(dir, cleanup_ec);
    throw;
  }

  ALERTS_LOG_INFO("Record created", {StringField("path", path.ToString()), StringField("author", record.author)});
  return path;
}

AlertRecord RecordStore::Read(const RecordPath& path) const {
  const auto manifest_path = Absolute(path) / std::string(alerts::storage::common::kManifestFileName);

  std::error_code ec;
  if (!fs::is_regular_file(manifest_path, ec)) {
    throw alerts::util::NotFound("record not found: " + path.ToString());
  }

  AlertRecord record = ParseManifest(alerts::storage::ReadFile(manifest_path));
  record.state       = path.state;
  return record;
}

std::optional<RecordPath> RecordStore::Resolve(const RecordPath& path) const {
  std::error_code ec;
  if (fs::is_directory(Absolute(path), ec)) return path;

  for (auto state : kAllStates) {
    if (state == path.state) continue;
    auto candidate = path.WithState(state);
    if (fs::is_directory(Absolute(candidate), ec)) return candidate;
  }
  return std::nullopt;
}

bool RecordStore::Exists(const RecordPath& path) const {
  std::error_code ec;
  return fs::is_directory(Absolute(path), ec);
}

RecordPath RecordStore::Move(const RecordPath& path, LifecycleState from, LifecycleState to) {
  if (!alerts::model::CanTransition(from, to)) {
    throw alerts::util::InvalidState("transition not allowed: " + std::string(alerts::model::ToString(from)) + " -> " +
                                     std::string(alerts::model::ToString(to)));
  }

  const RecordPath source = path.WithState(from);
  const RecordPath target = path.WithState(to);

  auto guard = LockRecord(source);

  const bool source_exists = Exists(source);
  const bool target_exists = Exists(target);

  if (from == to || (target_exists && !source_exists)) {
    if (!target_exists) throw alerts::util::NotFound("record not found: " + target.ToString());
    return target;
  }
  if (!source_exists) {
    throw alerts::util::NotFound("record not found: " + source.ToString());
  }
  if (target_exists) {
    throw alerts::util::InvalidState("record present in both states: " + path.Key());
  }

  CreateDirectoryOrThrow(Absolute(target).parent_path());

  std::error_code ec;
  fs::rename(Absolute(source), Absolute(target), ec);
  if (ec) throw alerts::util::IOError("move " + source.ToString() + " failed: " + ec.message());

  ALERTS_LOG_INFO("Record moved", {StringField("from", source.ToString()), StringField("to", target.ToString())});
  return target;
}

std::vector<RecordPath> RecordStore::List(std::optional<LifecycleState> state) const {
  std::vector<RecordPath> out;
  std::error_code         ec;
  const auto              deadline = ScanDeadline();
  const std::string       what     = "listing of " + options_.root.string();

  deadline.Check(what);
  for (fs::directory_iterator bucket_it(options_.root, ec), end; !ec && bucket_it != end; bucket_it.increment(ec)) {
    deadline.Check(what);
    const auto bucket = bucket_it->path().filename().string();
    if (!bucket_it->is_directory(ec) || !alerts::storage::common::IsBucketName(bucket)) continue;

    for (auto s : kAllStates) {
      if (state && *state != s) continue;

      const auto      state_dir = bucket_it->path() / std::string(alerts::model::ToString(s));
      std::error_code inner_ec;
      if (!fs::is_directory(state_dir, inner_ec)) continue;

      for (fs::directory_iterator slug_it(state_dir, inner_ec); !inner_ec && slug_it != end; slug_it.increment(inner_ec)) {
        deadline.Check(what);
        const auto slug = slug_it->path().filename().string();
        if (!alerts::storage::common::IsRecordSlug(slug)) continue;
        out.push_back(RecordPath{bucket, s, slug});
      }
      if (inner_ec) throw alerts::util::IOError("listing " + state_dir.string() + " failed: " + inner_ec.message());
    }
  }
  if (ec) throw alerts::util::IOError("listing " + options_.root.string() + " failed: " + ec.message());

  std::sort(out.begin(), out.end());
  return out;
}

void RecordStore::EnsureSkeleton(const RecordPath& path) {
  const auto dir = Absolute(path);
  CreateDirectoryOrThrow(dir / std::string(alerts::storage::common::kImagesDir));
  CreateDirectoryOrThrow(dir / std::string(alerts::storage::common::kCommentsDir));
}

alerts::lock::PathLockTable::Guard RecordStore::LockRecord(const RecordPath& path) const {
  const auto current = Resolve(path);
  return locks_->Acquire(path.Key(), Absolute(current ? *current : path));
}

} // namespace alerts::store
