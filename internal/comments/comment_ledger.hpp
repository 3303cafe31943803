#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/alert_record.hpp"
#include "internal/model/record_path.hpp"
#include "internal/util/time.hpp"

namespace alerts::store {
class RecordStore;
}

namespace alerts::comments {

// {YYYY-MM-DD_HH-MM-SS}_{author}[_{seq}].txt
std::string CommentFileName(alerts::util::TimePoint created_at, const std::string& author, std::optional<unsigned long> seq = std::nullopt);

/*
  Comment file content:

      > 2025-12-14 21:15_23 -- X13K0G
      body lines
      --> npub: npub1...
      --> signature: ...

  signature is always the last line when present.
*/
std::string FormatComment(const alerts::model::Comment& comment);

alerts::model::Comment ParseComment(std::string_view text);

struct StoredComment {
  std::string            file_name;
  alerts::model::Comment comment;
};

/*
  CommentLedger

  Append-only comment thread of one record. The file name depends only on
  (second, author, sequence found on disk), so the device that first
  writes a comment always picks the same name for the same inputs; other
  devices receive that name with the replicated comment.
*/
class CommentLedger {
 public:
  explicit CommentLedger(std::shared_ptr<alerts::store::RecordStore> store);

  // Returns the file name written under comments/.
  std::string Append(const alerts::model::RecordPath& path, const alerts::model::Comment& comment);

  // Ordered by (second, author, sequence). Files that do not follow the
  // canonical naming (legacy epoch-millisecond names) are skipped.
  std::vector<StoredComment> List(const alerts::model::RecordPath& path) const;

 private:
  std::shared_ptr<alerts::store::RecordStore> store_;
};

} // namespace alerts::comments
