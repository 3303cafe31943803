#include "path_grammar.hpp"

#include <vector>

#include "internal/util/errors.hpp"

namespace alerts::storage::common {

namespace {

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

bool AllDigits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!IsDigit(c)) return false;
  }
  return true;
}

// -?D{1,3}.D{1,6}
bool IsTruncatedDecimal(std::string_view s) {
  if (!s.empty() && s.front() == '-') s.remove_prefix(1);
  const auto dot = s.find('.');
  if (dot == std::string_view::npos) return false;
  const auto whole    = s.substr(0, dot);
  const auto fraction = s.substr(dot + 1);
  return AllDigits(whole) && whole.size() <= 3 && AllDigits(fraction) && fraction.size() <= 6;
}

// Fixed-width digit layout check, 'D' = digit, anything else literal.
bool MatchesLayout(std::string_view s, std::string_view layout) {
  if (s.size() != layout.size()) return false;
  for (std::size_t i = 0; i < layout.size(); ++i) {
    if (layout[i] == 'D') {
      if (!IsDigit(s[i])) return false;
    } else if (s[i] != layout[i]) {
      return false;
    }
  }
  return true;
}

std::vector<std::string_view> Split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  while (true) {
    const auto pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

[[noreturn]] void Reject(std::string_view what, std::string_view value) {
  throw alerts::util::PathTraversalRejected(std::string(what) + ": '" + std::string(value) + "'");
}

} // namespace

bool IsBucketName(std::string_view bucket) {
  const auto sep = bucket.find('_');
  if (sep == std::string_view::npos) return false;
  const auto lat = bucket.substr(0, sep);
  const auto lon = bucket.substr(sep + 1);
  if (!IsTruncatedDecimal(lat) || !IsTruncatedDecimal(lon)) return false;

  // both halves share one precision
  return lat.size() - lat.find('.') == lon.size() - lon.find('.');
}

bool IsRecordSlug(std::string_view slug) {
  constexpr std::string_view kStampLayout = "DDDD-DD-DD_DD-DD_";
  if (slug.size() <= kStampLayout.size()) return false;
  if (!MatchesLayout(slug.substr(0, kStampLayout.size()), kStampLayout)) return false;

  const auto title = slug.substr(kStampLayout.size());
  if (title.size() > 60 || title.front() == '-' || title.back() == '-') return false;
  for (char c : title) {
    const bool ok = (c >= 'a' && c <= 'z') || IsDigit(c) || c == '-';
    if (!ok) return false;
  }
  return true;
}

bool IsAttachmentFileName(std::string_view name) {
  constexpr std::string_view kPrefix = "photo";
  if (name.substr(0, kPrefix.size()) != kPrefix) return false;
  name.remove_prefix(kPrefix.size());

  const auto dot = name.find('.');
  if (dot == std::string_view::npos) return false;
  const auto index = name.substr(0, dot);
  const auto ext   = name.substr(dot + 1);
  if (!AllDigits(index) || index.front() == '0' || index.size() > 9) return false;
  if (ext.empty() || ext.size() > 8) return false;
  for (char c : ext) {
    if (!((c >= 'a' && c <= 'z') || IsDigit(c))) return false;
  }
  return true;
}

bool IsCallsign(std::string_view callsign) {
  if (callsign.empty() || callsign.size() > 32) return false;
  for (char c : callsign) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || IsDigit(c);
    if (!ok) return false;
  }
  return true;
}

std::optional<CommentName> ParseCommentFileName(std::string_view name) {
  constexpr std::string_view kStampLayout = "DDDD-DD-DD_DD-DD-DD_";
  constexpr std::string_view kExtension   = ".txt";

  if (name.size() <= kStampLayout.size() + kExtension.size()) return std::nullopt;
  if (!MatchesLayout(name.substr(0, kStampLayout.size()), kStampLayout)) return std::nullopt;
  if (name.substr(name.size() - kExtension.size()) != kExtension) return std::nullopt;

  CommentName parsed;
  parsed.second = std::string(name.substr(0, kStampLayout.size() - 1));

  auto rest = name.substr(kStampLayout.size(), name.size() - kStampLayout.size() - kExtension.size());

  const auto sep = rest.find('_');
  if (sep != std::string_view::npos) {
    const auto seq = rest.substr(sep + 1);
    if (!AllDigits(seq) || seq.front() == '0' || seq.size() > 9) return std::nullopt;
    parsed.seq = std::stoul(std::string(seq));
    rest       = rest.substr(0, sep);
  }

  if (!IsCallsign(rest)) return std::nullopt;
  parsed.author = std::string(rest);
  return parsed;
}

alerts::model::RecordPath ParseRecordPath(std::string_view path) {
  if (path.empty()) Reject("empty record path", path);
  if (path.find('\0') != std::string_view::npos || path.find('\\') != std::string_view::npos) {
    Reject("record path contains invalid character", path);
  }

  // one optional trailing slash, as in "38.7_-9.1/active/slug/"
  if (path.back() == '/') path.remove_suffix(1);

  const auto parts = Split(path, '/');
  if (parts.size() != 3) Reject("record path must be bucket/state/slug", path);

  if (!IsBucketName(parts[0])) Reject("invalid bucket", parts[0]);
  const auto state = alerts::model::ParseLifecycleState(parts[1]);
  if (!state) Reject("invalid state segment", parts[1]);
  if (!IsRecordSlug(parts[2])) Reject("invalid record slug", parts[2]);

  alerts::model::RecordPath record;
  record.bucket = std::string(parts[0]);
  record.state  = *state;
  record.slug   = std::string(parts[2]);
  return record;
}

void ValidateFileName(std::string_view directory, std::string_view name) {
  if (directory.empty()) {
    if (!IsManifestFileName(name)) Reject("invalid record file name", name);
    return;
  }
  if (directory == kImagesDir) {
    if (!IsAttachmentFileName(name)) Reject("invalid attachment file name", name);
    return;
  }
  if (directory == kCommentsDir) {
    if (!IsCommentFileName(name)) Reject("invalid comment file name", name);
    return;
  }
  Reject("unknown record sub-directory", directory);
}

} // namespace alerts::storage::common
