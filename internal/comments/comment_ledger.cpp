#include "comment_ledger.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <tuple>

#include "internal/observability/logging.hpp"
#include "internal/storage/atomic_file.hpp"
#include "internal/storage/common/path_grammar.hpp"
#include "internal/store/manifest.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/errors.hpp"

namespace alerts::comments {

using alerts::observability::IntField;
using alerts::observability::StringField;
using alerts::storage::common::CommentName;

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kHeaderPrefix    = "> ";
constexpr std::string_view kHeaderSeparator = " -- ";
constexpr std::string_view kMetadataPrefix  = "--> ";

struct NamedFile {
  std::string file_name;
  CommentName name;
};

std::vector<NamedFile> ScanComments(const fs::path& dir, const alerts::util::Deadline& deadline, std::size_t* skipped) {
  std::vector<NamedFile> files;
  std::error_code        ec;
  const std::string      what = "scan of " + dir.string();

  deadline.Check(what);
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    deadline.Check(what);
    if (!it->is_regular_file(ec) || alerts::storage::IsTempFile(it->path())) continue;

    const auto file_name = it->path().filename().string();
    auto       parsed    = alerts::storage::common::ParseCommentFileName(file_name);
    if (!parsed) {
      if (skipped) ++*skipped;
      continue;
    }
    files.push_back({file_name, std::move(*parsed)});
  }
  if (ec) throw alerts::util::IOError("listing " + dir.string() + " failed: " + ec.message());

  std::sort(files.begin(), files.end(), [](const NamedFile& a, const NamedFile& b) {
    return std::make_tuple(a.name.second, a.name.author, a.name.seq.value_or(0)) <
           std::make_tuple(b.name.second, b.name.author, b.name.seq.value_or(0));
  });
  return files;
}

} // namespace

std::string CommentFileName(alerts::util::TimePoint created_at, const std::string& author, std::optional<unsigned long> seq) {
  if (!alerts::storage::common::IsCallsign(author)) {
    throw std::invalid_argument("invalid author callsign: '" + author + "'");
  }

  std::string name = alerts::util::FormatFileSecond(alerts::util::TruncateToSecond(created_at)) + "_" + author;
  if (seq) name += "_" + std::to_string(*seq);
  return name + ".txt";
}

std::string FormatComment(const alerts::model::Comment& comment) {
  if (!alerts::storage::common::IsCallsign(comment.author)) {
    throw std::invalid_argument("invalid author callsign: '" + comment.author + "'");
  }

  std::string out;
  out.append(kHeaderPrefix)
      .append(alerts::util::FormatDisplay(alerts::util::TruncateToSecond(comment.created_at)))
      .append(kHeaderSeparator)
      .append(comment.author)
      .append("\n");

  if (!comment.body.empty()) {
    out.append(comment.body);
    if (comment.body.back() != '\n') out.append("\n");
  }

  alerts::store::AppendMetadataLines(out, comment.metadata, comment.signature);
  return out;
}

alerts::model::Comment ParseComment(std::string_view text) {
  const auto header_end = text.find('\n');
  const auto header     = text.substr(0, header_end);

  if (header.substr(0, kHeaderPrefix.size()) != kHeaderPrefix) {
    throw std::invalid_argument("comment header missing");
  }
  const auto separator = header.find(kHeaderSeparator);
  if (separator == std::string_view::npos) {
    throw std::invalid_argument("comment header malformed");
  }

  alerts::model::Comment comment;
  comment.created_at = alerts::util::ParseDisplay(std::string(header.substr(kHeaderPrefix.size(), separator - kHeaderPrefix.size())));
  comment.author     = std::string(header.substr(separator + kHeaderSeparator.size()));

  std::vector<std::string_view> lines;
  if (header_end != std::string_view::npos) {
    auto rest = text.substr(header_end + 1);
    while (!rest.empty()) {
      const auto end = rest.find('\n');
      lines.push_back(rest.substr(0, end));
      if (end == std::string_view::npos) break;
      rest.remove_prefix(end + 1);
    }
  }

  std::size_t metadata_start = lines.size();
  while (metadata_start > 0 && lines[metadata_start - 1].substr(0, kMetadataPrefix.size()) == kMetadataPrefix) {
    --metadata_start;
  }

  for (std::size_t i = 0; i < metadata_start; ++i) {
    if (i > 0) comment.body.push_back('\n');
    comment.body.append(lines[i]);
  }

  for (std::size_t i = metadata_start; i < lines.size(); ++i) {
    std::string key, value;
    if (!alerts::store::ParseMetadataLine(lines[i], key, value)) continue;
    if (key == "signature") {
      comment.signature = value;
    } else {
      comment.metadata.emplace_back(std::move(key), std::move(value));
    }
  }

  return comment;
}

CommentLedger::CommentLedger(std::shared_ptr<alerts::store::RecordStore> store) : store_(std::move(store)) {
}

std::string CommentLedger::Append(const alerts::model::RecordPath& path, const alerts::model::Comment& input) {
  alerts::model::Comment comment = input;
  comment.created_at             = alerts::util::TruncateToSecond(comment.created_at);

  const std::string content = FormatComment(comment);

  auto guard = store_->LockRecord(path);

  const auto current = store_->Resolve(path);
  if (!current) {
    throw alerts::util::NotFound("record not found: " + path.ToString());
  }

  const auto dir    = store_->Absolute(*current) / std::string(alerts::storage::common::kCommentsDir);
  const auto second = alerts::util::FormatFileSecond(comment.created_at);

  // sequence from disk: the unsuffixed file is 0, each collision takes max + 1
  std::optional<unsigned long> seq;
  for (const auto& file : ScanComments(dir, store_->ScanDeadline(), nullptr)) {
    if (file.name.second != second || file.name.author != comment.author) continue;
    const unsigned long existing = file.name.seq.value_or(0);
    seq                          = seq ? std::max(*seq, existing + 1) : existing + 1;
  }

  const auto file_name = CommentFileName(comment.created_at, comment.author, seq);
  alerts::storage::WriteFileAtomic(dir / file_name, content, store_->Fsync());

  ALERTS_LOG_INFO("Comment appended", {StringField("path", current->ToString()), StringField("file", file_name)});
  return file_name;
}

std::vector<StoredComment> CommentLedger::List(const alerts::model::RecordPath& path) const {
  const auto current = store_->Resolve(path);
  if (!current) {
    throw alerts::util::NotFound("record not found: " + path.ToString());
  }

  const auto  dir     = store_->Absolute(*current) / std::string(alerts::storage::common::kCommentsDir);
  std::size_t skipped = 0;

  std::vector<StoredComment> out;
  for (auto& file : ScanComments(dir, store_->ScanDeadline(), &skipped)) {
    StoredComment stored;
    stored.file_name = file.file_name;
    stored.comment   = ParseComment(alerts::storage::ReadFile(dir / file.file_name));
    out.push_back(std::move(stored));
  }

  if (skipped > 0) {
    ALERTS_LOG_INFO("Skipped non-canonical comment files", {StringField("path", current->ToString()), IntField("count", static_cast<int64_t>(skipped))});
  }
  return out;
}

} // namespace alerts::comments
