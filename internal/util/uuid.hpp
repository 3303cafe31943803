#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace alerts::util {

/*
  UUID helpers

  SyncPayload ids are random RFC4122 v4 UUIDs in canonical text form; the
  spool names its files after them.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// 8-4-4-4-12 lowercase hex
bool IsCanonicalUUID(std::string_view text);

inline std::string NewPayloadId() {
  return ToString(GenerateUUID());
}

} // namespace alerts::util
