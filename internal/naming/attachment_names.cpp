#include "attachment_names.hpp"

#include <algorithm>

namespace alerts::naming {

NormalizedExtension NormalizeExtension(std::string_view ext) {
  if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);

  std::string lowered(ext);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
  });

  for (auto allowed : kAllowedExtensions) {
    if (lowered == allowed) return {lowered, false};
  }
  return {std::string(kFallbackExtension), true};
}

std::string ExtensionOf(std::string_view original_file_name) {
  const auto slash = original_file_name.find_last_of("/\\");
  if (slash != std::string_view::npos) original_file_name.remove_prefix(slash + 1);

  const auto dot = original_file_name.rfind('.');
  if (dot == std::string_view::npos || dot == 0) return {};
  return std::string(original_file_name.substr(dot + 1));
}

std::string NextName(std::size_t existing_count, std::string_view ext) {
  return "photo" + std::to_string(existing_count + 1) + "." + std::string(ext);
}

} // namespace alerts::naming
