#pragma once

#include <string>
#include <string_view>

namespace alerts::util {

/*
  Content hashing.

  Lowercase hex SHA-256; the identity used for attachment dedup and for
  idempotent replication.
*/
std::string Sha256Hex(std::string_view bytes);

} // namespace alerts::util
