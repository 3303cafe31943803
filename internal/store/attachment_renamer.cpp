#include "attachment_renamer.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "internal/naming/attachment_names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/storage/common/path_grammar.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace alerts::store {

using alerts::observability::BoolField;
using alerts::observability::StringField;

namespace fs = std::filesystem;

namespace {

unsigned long IndexOf(const std::string& name) {
  // "photo12.jpg" → 12; callers pass grammar-checked names
  return std::stoul(name.substr(5, name.find('.') - 5));
}

std::vector<std::string> ListAttachments(const fs::path& images_dir, const alerts::util::Deadline& deadline) {
  std::vector<std::string> names;
  std::error_code          ec;
  const std::string        what = "scan of " + images_dir.string();

  deadline.Check(what);
  for (fs::directory_iterator it(images_dir, ec), end; !ec && it != end; it.increment(ec)) {
    deadline.Check(what);
    const auto name = it->path().filename().string();
    if (it->is_regular_file(ec) && alerts::storage::common::IsAttachmentFileName(name)) {
      names.push_back(name);
    }
  }
  if (ec) throw alerts::util::IOError("listing " + images_dir.string() + " failed: " + ec.message());

  std::sort(names.begin(), names.end(), [](const std::string& a, const std::string& b) { return IndexOf(a) < IndexOf(b); });
  return names;
}

} // namespace

AttachmentRenamer::AttachmentRenamer(std::shared_ptr<RecordStore> store) : store_(std::move(store)) {
}

AttachResult AttachmentRenamer::Attach(const alerts::model::RecordPath& path, std::string_view original_file_name, std::string_view bytes) {
  auto guard = store_->LockRecord(path);

  const auto current = store_->Resolve(path);
  if (!current) {
    throw alerts::util::NotFound("record not found: " + path.ToString());
  }

  const auto images_dir = store_->Absolute(*current) / std::string(alerts::storage::common::kImagesDir);
  const auto deadline   = store_->ScanDeadline();
  const auto existing   = ListAttachments(images_dir, deadline);

  AttachResult result;
  result.content_hash = alerts::util::Sha256Hex(bytes);

  for (const auto& name : existing) {
    deadline.Check("dedup of " + images_dir.string());
    if (alerts::util::Sha256Hex(alerts::storage::ReadFile(images_dir / name)) == result.content_hash) {
      result.file_name    = name;
      result.deduplicated = true;
      ALERTS_LOG_INFO("Attachment already present", {StringField("path", current->ToString()), StringField("file", name)});
      return result;
    }
  }

  const auto ext           = alerts::naming::NormalizeExtension(alerts::naming::ExtensionOf(original_file_name));
  result.extension_coerced = ext.coerced;
  result.file_name         = alerts::naming::NextName(existing.size(), ext.extension);

  // a gap left by an incomplete replica must not make the next index collide
  const auto max_index = existing.empty() ? 0UL : IndexOf(existing.back());
  if (max_index > existing.size()) {
    result.file_name = alerts::naming::NextName(max_index, ext.extension);
    ALERTS_LOG_WARN("Attachment index gap, appending after highest index",
                    {StringField("path", current->ToString()), StringField("file", result.file_name)});
  }

  if (ext.coerced) {
    ALERTS_LOG_WARN("Attachment extension not allowed, coerced",
                    {StringField("path", current->ToString()), StringField("stored_as", result.file_name)});
  }

  alerts::storage::WriteFileAtomic(images_dir / result.file_name, bytes, store_->Fsync());

  ALERTS_LOG_INFO("Attachment stored",
                  {StringField("path", current->ToString()), StringField("file", result.file_name), BoolField("coerced", ext.coerced)});
  return result;
}

std::vector<std::string> AttachmentRenamer::List(const alerts::model::RecordPath& path) const {
  const auto current = store_->Resolve(path);
  if (!current) {
    throw alerts::util::NotFound("record not found: " + path.ToString());
  }
  return ListAttachments(store_->Absolute(*current) / std::string(alerts::storage::common::kImagesDir), store_->ScanDeadline());
}

} // namespace alerts::store
