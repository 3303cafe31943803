#include "spool.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace alerts::spool {

using alerts::observability::StringField;

namespace fs = std::filesystem;

namespace {

void CreateDirectoryOrThrow(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw alerts::util::IOError("create " + dir.string() + " failed: " + ec.message());
}

bool HasPayloadSuffix(const std::string& name) {
  return name.size() > kPayloadSuffix.size() &&
         name.compare(name.size() - kPayloadSuffix.size(), kPayloadSuffix.size(), kPayloadSuffix) == 0;
}

} // namespace

Spool::Spool(fs::path dir, bool fsync) : dir_(std::move(dir)), fsync_(fsync) {
  CreateDirectoryOrThrow(dir_);
}

fs::path Spool::Put(const alerts::v1::SyncPayload& payload) {
  if (!alerts::util::IsCanonicalUUID(payload.id())) {
    throw alerts::util::InvalidState("payload id is not a UUID: " + payload.id());
  }

  std::string bytes;
  if (!payload.SerializeToString(&bytes)) {
    throw alerts::util::IOError("serialize payload " + payload.id() + " failed");
  }

  const auto file = dir_ / (payload.id() + std::string(kPayloadSuffix));
  alerts::storage::WriteFileAtomic(file, bytes, fsync_);

  ALERTS_LOG_DEBUG("Payload spooled", {StringField("id", payload.id()), StringField("spool", dir_.string())});
  return file;
}

std::vector<fs::path> Spool::Pending() const {
  std::vector<std::pair<fs::file_time_type, fs::path>> entries;

  std::error_code ec;
  for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) continue;
    if (!HasPayloadSuffix(it->path().filename().string())) continue;

    const auto mtime = it->last_write_time(entry_ec);
    if (entry_ec) continue;  // picked up and removed meanwhile
    entries.emplace_back(mtime, it->path());
  }
  if (ec) throw alerts::util::IOError("listing " + dir_.string() + " failed: " + ec.message());

  std::sort(entries.begin(), entries.end());

  std::vector<fs::path> out;
  out.reserve(entries.size());
  for (auto& entry : entries) out.push_back(std::move(entry.second));
  return out;
}

alerts::v1::SyncPayload Spool::Load(const fs::path& file) const {
  const auto bytes = alerts::storage::ReadFile(file);

  alerts::v1::SyncPayload payload;
  if (!payload.ParseFromString(bytes)) {
    throw alerts::util::InvalidState("malformed spool file: " + file.filename().string());
  }
  if (!alerts::util::IsCanonicalUUID(payload.id())) {
    throw alerts::util::InvalidState("spool file carries invalid id: " + file.filename().string());
  }
  return payload;
}

void Spool::Remove(const fs::path& file) {
  std::error_code ec;
  fs::remove(file, ec);
  if (ec) throw alerts::util::IOError("remove " + file.string() + " failed: " + ec.message());
}

fs::path Spool::Reject(const fs::path& file) {
  const auto rejected_dir = dir_ / std::string(kRejectedDir);
  CreateDirectoryOrThrow(rejected_dir);

  const auto target = rejected_dir / file.filename();
  std::error_code ec;
  fs::rename(file, target, ec);
  if (ec) throw alerts::util::IOError("reject " + file.string() + " failed: " + ec.message());

  ALERTS_LOG_WARN("Payload moved to rejected", {StringField("file", target.string())});
  return target;
}

} // namespace alerts::spool
