#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/record_path.hpp"

namespace alerts::store {

class RecordStore;

struct AttachResult {
  std::string file_name;
  std::string content_hash;

  // identical bytes were already attached; nothing new was written
  bool deduplicated = false;

  // the upload's extension was off the allow-list and stored as .bin
  bool extension_coerced = false;
};

/*
  AttachmentRenamer

  Stores an uploaded photo as images/photoN.ext, N = 1 + attachments
  already present. The original file name never reaches the disk.

  The whole attach (list → name → write) runs under the record lock, so
  concurrent attaches on one record produce photo1..photoN without gaps.
*/
class AttachmentRenamer {
 public:
  explicit AttachmentRenamer(std::shared_ptr<RecordStore> store);

  AttachResult Attach(const alerts::model::RecordPath& path, std::string_view original_file_name, std::string_view bytes);

  // Attachment names in images/, ordered by index.
  std::vector<std::string> List(const alerts::model::RecordPath& path) const;

 private:
  std::shared_ptr<RecordStore> store_;
};

} // namespace alerts::store
