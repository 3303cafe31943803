#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"

namespace alerts::util {

/*
  Time utilities. Single place to control clock source and the textual
  timestamp forms that end up in file names.

  All formatting is UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

TimePoint TruncateToSecond(TimePoint tp);
TimePoint TruncateToMinute(TimePoint tp);

// 2025-12-14_15-32
std::string FormatSlugMinute(TimePoint tp);
// 2025-12-14_15-32-07
std::string FormatFileSecond(TimePoint tp);
// 2025-12-14 15:32_07 (comment header form)
std::string FormatDisplay(TimePoint tp);
// 2025-12-14T15:32:07Z
std::string FormatIso8601(TimePoint tp);

// Accepts the ISO form above (second precision, trailing Z).
TimePoint ParseIso8601(const std::string& text);
// Accepts the file-name form 2025-12-14_15-32-07.
TimePoint ParseFileSecond(const std::string& text);
// Accepts the comment header form 2025-12-14 15:32_07.
TimePoint ParseDisplay(const std::string& text);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

uint64_t ToUnixSeconds(TimePoint tp);

} // namespace alerts::util
