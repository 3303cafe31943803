#pragma once

#include <string>
#include <string_view>

#include "internal/model/alert_record.hpp"

namespace alerts::store {

/*
  manifest.txt is written once by the author, immutable afterwards:

      # ALERT: {title}

      CREATED: 2025-12-14T15:32:00Z
      AUTHOR: X13K0G
      COORDINATES: 38.7223000,-9.1393000

      {body}

      --> key: value
      --> signature: {opaque}

  The lifecycle state is not stored; it is the path's state segment.
*/
std::string FormatManifest(const alerts::model::AlertRecord& record);

alerts::model::AlertRecord ParseManifest(std::string_view text);

// "--> key: value" lines, signature last. Shared with comment files.
void AppendMetadataLines(std::string& out, const alerts::model::Metadata& metadata, const std::string& signature);

// Returns true and fills key/value if line is a metadata line.
bool ParseMetadataLine(std::string_view line, std::string& key, std::string& value);

} // namespace alerts::store
