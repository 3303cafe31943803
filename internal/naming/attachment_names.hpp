#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace alerts::naming {

inline constexpr std::array<std::string_view, 5> kAllowedExtensions = {"jpg", "jpeg", "png", "webp", "heic"};

// Extension an unknown upload is stored under.
inline constexpr std::string_view kFallbackExtension = "bin";

struct NormalizedExtension {
  std::string extension;
  bool        coerced = false;
};

// Lowercases, strips a leading dot, maps anything off the allow-list to
// kFallbackExtension.
NormalizedExtension NormalizeExtension(std::string_view ext);

// Extension of an original upload name ("beach.JPG" → "JPG"); empty if none.
std::string ExtensionOf(std::string_view original_file_name);

// photo{existing_count + 1}.{ext}; ext must already be normalized.
std::string NextName(std::size_t existing_count, std::string_view ext);

} // namespace alerts::naming
