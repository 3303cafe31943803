#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace alerts::util {
class CancellationToken;
}

namespace alerts::storage {

/*
  File IO for everything under the alerts root, through Arrow IO.

  Properties:
    - atomic replace writes (tmp → flush → rename), so readers never
      observe a partial manifest, comment or photo
    - temp files are removed when a write fails or is cancelled
*/

inline constexpr std::string_view kTempSuffix = ".tmp";

void WriteFileAtomic(const std::filesystem::path& path, std::string_view bytes, bool fsync,
                     const alerts::util::CancellationToken* cancel = nullptr);

std::string ReadFile(const std::filesystem::path& path);

bool IsTempFile(const std::filesystem::path& path);

} // namespace alerts::storage
