#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "alerts/v1/sync.pb.h"

namespace alerts::spool {

inline constexpr std::string_view kPayloadSuffix = ".syncpb";
inline constexpr std::string_view kRejectedDir   = "rejected";

/*
  Spool

  Directory of serialized SyncPayload messages, one {id}.syncpb file each.
  The outbox is where local operations leave payloads for the transport;
  the inbox is where the transport drops payloads received from peers.
*/
class Spool {
 public:
  Spool(std::filesystem::path dir, bool fsync);

  std::filesystem::path Put(const alerts::v1::SyncPayload& payload);

  // Oldest first; temp files and rejected/ are skipped.
  std::vector<std::filesystem::path> Pending() const;

  // Throws util::InvalidState for files that do not parse or carry a bad id.
  alerts::v1::SyncPayload Load(const std::filesystem::path& file) const;

  void Remove(const std::filesystem::path& file);

  // Moves the file under rejected/ and returns its new location.
  std::filesystem::path Reject(const std::filesystem::path& file);

  const std::filesystem::path& Dir() const {
    return dir_;
  }

 private:
  std::filesystem::path dir_;
  bool                  fsync_;
};

} // namespace alerts::spool
