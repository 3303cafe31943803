#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/record_path.hpp"

namespace alerts::storage::common {

/*
  Grammar checks for literal, origin-chosen names.

  These only recognise the shape of a canonical path or file name; they
  never produce one. Anything that does not match (.., absolute paths,
  backslashes, extra segments, NUL) is rejected with
  util::PathTraversalRejected.
*/

inline constexpr std::string_view kManifestFileName = "manifest.txt";
inline constexpr std::string_view kImagesDir        = "images";
inline constexpr std::string_view kCommentsDir      = "comments";

inline bool IsManifestFileName(std::string_view name) {
  return name == kManifestFileName;
}

bool IsBucketName(std::string_view bucket);
bool IsRecordSlug(std::string_view slug);

// photoN.ext, N >= 1 without leading zeros.
bool IsAttachmentFileName(std::string_view name);

struct CommentName {
  std::string                  second;  // YYYY-MM-DD_HH-MM-SS
  std::string                  author;
  std::optional<unsigned long> seq;
};

// {YYYY-MM-DD_HH-MM-SS}_{author}[_{seq}].txt
std::optional<CommentName> ParseCommentFileName(std::string_view name);

inline bool IsCommentFileName(std::string_view name) {
  return ParseCommentFileName(name).has_value();
}

bool IsCallsign(std::string_view callsign);

alerts::model::RecordPath ParseRecordPath(std::string_view path);

// Throws util::PathTraversalRejected unless name is a valid file name for
// the given sub-directory ("" for the record directory itself).
void ValidateFileName(std::string_view directory, std::string_view name);

} // namespace alerts::storage::common
