#include "atomic_file.hpp"

#include <arrow/io/file.h>

#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace alerts::storage {

using namespace alerts::storage::common;

namespace {

void DiscardTemp(const std::filesystem::path& tmp_path) {
  std::error_code ec;
  std::filesystem::remove(tmp_path, ec);
}

} // namespace

/*
  Atomic write:
      write tmp → flush → rename
*/
void WriteFileAtomic(const std::filesystem::path& path, std::string_view bytes, bool fsync, const alerts::util::CancellationToken* cancel) {
  const auto tmp_path = std::filesystem::path(path.string() + std::string(kTempSuffix));

  try {
    {
      auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
      Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));

      if (fsync) Unwrap(out->Flush());

      Unwrap(out->Close());
    }

    if (cancel) cancel->ThrowIfCancelled(path.string());

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) throw alerts::util::IOError("rename " + tmp_path.string() + " failed: " + ec.message());
  } catch (...) {
    DiscardTemp(tmp_path);
    throw;
  }
}

/*
  Read entire file from disk.
*/
std::string ReadFile(const std::filesystem::path& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());
  return buffer->ToString();
}

bool IsTempFile(const std::filesystem::path& path) {
  const auto name = path.filename().string();
  return name.size() >= kTempSuffix.size() && name.compare(name.size() - kTempSuffix.size(), kTempSuffix.size(), kTempSuffix) == 0;
}

} // namespace alerts::storage
