#include "path_codec.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace alerts::naming {

namespace {

// Absorbs binary representation error (2.3 * 10 == 22.999...), far below
// any coordinate precision a device can report.
constexpr double kTruncationEpsilon = 1e-9;

std::string TruncatedDecimal(double value, int precision) {
  const double  scale  = std::pow(10.0, precision);
  const double  scaled = std::fabs(value) * scale + kTruncationEpsilon;
  const int64_t units  = static_cast<int64_t>(std::trunc(scaled));
  const int64_t unit   = static_cast<int64_t>(scale);

  std::string fraction = std::to_string(units % unit);
  fraction.insert(0, static_cast<std::size_t>(precision) - fraction.size(), '0');

  std::string out = std::signbit(value) && value != 0.0 ? "-" : "";
  out += std::to_string(units / unit);
  out += '.';
  out += fraction;
  return out;
}

} // namespace

void ValidateCoordinates(const alerts::model::Coordinates& coordinates) {
  if (!std::isfinite(coordinates.lat) || !std::isfinite(coordinates.lon)) {
    throw alerts::util::InvalidCoordinates("coordinates must be finite");
  }
  if (std::fabs(coordinates.lat) > 90.0) {
    throw alerts::util::InvalidCoordinates("latitude out of range: " + std::to_string(coordinates.lat));
  }
  if (std::fabs(coordinates.lon) > 180.0) {
    throw alerts::util::InvalidCoordinates("longitude out of range: " + std::to_string(coordinates.lon));
  }
}

std::string BucketName(const alerts::model::Coordinates& coordinates, int precision) {
  if (precision < kMinPrecision || precision > kMaxPrecision) {
    throw std::invalid_argument("bucket precision out of range: " + std::to_string(precision));
  }
  ValidateCoordinates(coordinates);
  return TruncatedDecimal(coordinates.lat, precision) + "_" + TruncatedDecimal(coordinates.lon, precision);
}

std::string Slugify(std::string_view title) {
  std::string slug;
  slug.reserve(title.size());

  for (char raw : title) {
    char c = raw;
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
    const bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    if (!keep) {
      c = '-';
    }
    if (c == '-' && !slug.empty() && slug.back() == '-') {
      continue;
    }
    slug.push_back(c);
  }

  auto trim = [](std::string& s) {
    while (!s.empty() && s.back() == '-') s.pop_back();
    std::size_t start = 0;
    while (start < s.size() && s[start] == '-') ++start;
    s.erase(0, start);
  };

  trim(slug);
  if (slug.size() > kMaxSlugLength) {
    slug.resize(kMaxSlugLength);
    trim(slug);
  }

  if (slug.empty()) {
    return "untitled";
  }
  return slug;
}

std::string RecordSlug(alerts::util::TimePoint created_at, std::string_view title) {
  return alerts::util::FormatSlugMinute(alerts::util::TruncateToMinute(created_at)) + "_" + Slugify(title);
}

alerts::model::RecordPath DerivePath(const alerts::model::Coordinates& coordinates, alerts::util::TimePoint created_at,
                                     std::string_view title, int precision) {
  ValidateCoordinates(coordinates);

  alerts::model::RecordPath path;
  path.bucket = BucketName(coordinates, precision);
  path.state  = alerts::model::LifecycleState::kActive;
  path.slug   = RecordSlug(created_at, title);
  return path;
}

} // namespace alerts::naming
