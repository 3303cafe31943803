#pragma once

#include <string>
#include <string_view>

#include "internal/model/coordinates.hpp"
#include "internal/model/record_path.hpp"
#include "internal/util/time.hpp"

namespace alerts::naming {

/*
  PathCodec

  Pure derivation of the canonical record path. Runs exactly once, on the
  authoring device, when the record is created. Nothing downstream calls
  it again for an existing record: replicas carry the literal path, because
  slug and rounding rules may drift between versions.
*/

inline constexpr std::size_t kMaxSlugLength = 60;
inline constexpr int         kMinPrecision  = 1;
inline constexpr int         kMaxPrecision  = 6;

// Throws util::InvalidCoordinates for |lat| > 90, |lon| > 180, NaN or inf.
void ValidateCoordinates(const alerts::model::Coordinates& coordinates);

// Truncation toward zero at `precision` decimals, e.g. "38.7_-9.1".
// A negative value that truncates to zero keeps its sign ("-0.0").
std::string BucketName(const alerts::model::Coordinates& coordinates, int precision = kMinPrecision);

std::string Slugify(std::string_view title);

// {createdAt:YYYY-MM-DD_HH-MM}_{Slugify(title)}
std::string RecordSlug(alerts::util::TimePoint created_at, std::string_view title);

alerts::model::RecordPath DerivePath(const alerts::model::Coordinates& coordinates, alerts::util::TimePoint created_at,
                                     std::string_view title, int precision = kMinPrecision);

} // namespace alerts::naming
