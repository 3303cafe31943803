#include "manifest.hpp"

#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "internal/storage/common/path_grammar.hpp"

namespace alerts::store {

namespace {

constexpr std::string_view kTitlePrefix       = "# ALERT: ";
constexpr std::string_view kCreatedPrefix     = "CREATED: ";
constexpr std::string_view kAuthorPrefix      = "AUTHOR: ";
constexpr std::string_view kCoordinatesPrefix = "COORDINATES: ";
constexpr std::string_view kMetadataPrefix    = "--> ";
constexpr std::string_view kSignatureKey      = "signature";

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

void RequireSingleLine(std::string_view value, std::string_view field) {
  if (value.find('\n') != std::string_view::npos || value.find('\r') != std::string_view::npos) {
    throw std::invalid_argument(std::string(field) + " must be a single line");
  }
}

std::vector<std::string_view> SplitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t                   start = 0;
  while (start < text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    auto line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

std::string FormatCoordinate(double value) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::fixed << std::setprecision(7) << value;
  return out.str();
}

double ParseCoordinate(std::string_view text) {
  std::istringstream in{std::string(text)};
  in.imbue(std::locale::classic());
  double value = 0.0;
  in >> value;
  if (in.fail() || !in.eof()) {
    throw std::invalid_argument("malformed coordinate: " + std::string(text));
  }
  return value;
}

} // namespace

void AppendMetadataLines(std::string& out, const alerts::model::Metadata& metadata, const std::string& signature) {
  for (const auto& [key, value] : metadata) {
    if (key == kSignatureKey) continue;
    RequireSingleLine(key, "metadata key");
    RequireSingleLine(value, "metadata value");
    if (key.empty() || key.find(':') != std::string::npos) {
      throw std::invalid_argument("invalid metadata key: " + key);
    }
    out.append(kMetadataPrefix).append(key).append(": ").append(value).append("\n");
  }

  if (!signature.empty()) {
    RequireSingleLine(signature, "signature");
    out.append(kMetadataPrefix).append(kSignatureKey).append(": ").append(signature).append("\n");
  }
}

bool ParseMetadataLine(std::string_view line, std::string& key, std::string& value) {
  if (!StartsWith(line, kMetadataPrefix)) return false;
  line.remove_prefix(kMetadataPrefix.size());

  const auto colon = line.find(':');
  if (colon == std::string_view::npos || colon == 0) return false;

  key   = std::string(line.substr(0, colon));
  value = std::string(line.substr(colon + 1));
  if (!value.empty() && value.front() == ' ') value.erase(0, 1);
  return true;
}

std::string FormatManifest(const alerts::model::AlertRecord& record) {
  RequireSingleLine(record.title, "title");
  if (!alerts::storage::common::IsCallsign(record.author)) {
    throw std::invalid_argument("invalid author callsign: '" + record.author + "'");
  }

  std::string out;
  out.append(kTitlePrefix).append(record.title).append("\n\n");
  out.append(kCreatedPrefix).append(alerts::util::FormatIso8601(record.created_at)).append("\n");
  out.append(kAuthorPrefix).append(record.author).append("\n");
  out.append(kCoordinatesPrefix)
      .append(FormatCoordinate(record.coordinates.lat))
      .append(",")
      .append(FormatCoordinate(record.coordinates.lon))
      .append("\n\n");

  if (!record.body.empty()) {
    out.append(record.body);
    if (record.body.back() != '\n') out.append("\n");
    out.append("\n");
  }

  AppendMetadataLines(out, record.metadata, record.signature);
  return out;
}

alerts::model::AlertRecord ParseManifest(std::string_view text) {
  const auto lines = SplitLines(text);

  alerts::model::AlertRecord record;
  bool                       has_title = false, has_created = false, has_author = false, has_coordinates = false;

  std::size_t i = 0;
  for (; i < lines.size(); ++i) {
    const auto line = lines[i];
    if (StartsWith(line, kTitlePrefix)) {
      record.title = std::string(line.substr(kTitlePrefix.size()));
      has_title    = true;
    } else if (StartsWith(line, kCreatedPrefix)) {
      record.created_at = alerts::util::ParseIso8601(std::string(line.substr(kCreatedPrefix.size())));
      has_created       = true;
    } else if (StartsWith(line, kAuthorPrefix)) {
      record.author = std::string(line.substr(kAuthorPrefix.size()));
      has_author    = true;
    } else if (StartsWith(line, kCoordinatesPrefix)) {
      const auto value = line.substr(kCoordinatesPrefix.size());
      const auto comma = value.find(',');
      if (comma == std::string_view::npos) throw std::invalid_argument("malformed COORDINATES line");
      record.coordinates.lat = ParseCoordinate(value.substr(0, comma));
      record.coordinates.lon = ParseCoordinate(value.substr(comma + 1));
      has_coordinates        = true;
    } else if (line.empty() && has_coordinates) {
      ++i;
      break;
    }
  }

  if (!has_title || !has_created || !has_author || !has_coordinates) {
    throw std::invalid_argument("manifest is missing required fields");
  }

  // trailing "--> " block is metadata, everything before it is body
  std::size_t metadata_start = lines.size();
  while (metadata_start > i && StartsWith(lines[metadata_start - 1], kMetadataPrefix)) {
    --metadata_start;
  }

  std::size_t body_end = metadata_start;
  while (body_end > i && lines[body_end - 1].empty()) --body_end;

  for (std::size_t b = i; b < body_end; ++b) {
    if (b > i) record.body.push_back('\n');
    record.body.append(lines[b]);
  }

  for (std::size_t m = metadata_start; m < lines.size(); ++m) {
    std::string key, value;
    if (!ParseMetadataLine(lines[m], key, value)) continue;
    if (key == kSignatureKey) {
      record.signature = value;
    } else {
      record.metadata.emplace_back(std::move(key), std::move(value));
    }
  }

  return record;
}

} // namespace alerts::store
