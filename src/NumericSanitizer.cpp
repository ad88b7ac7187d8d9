#include "NumericSanitizer.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <spdlog/spdlog.h>

#include <cmath>

std::optional<double> parseOptionalNumber(const std::string& text) {
  const std::string trimmed = boost::algorithm::trim_copy(text);
  double value = 0.0;
  if (trimmed.empty() || !boost::conversion::try_lexical_convert(trimmed, value)) {
    return std::nullopt;
  }
  if (!std::isfinite(value)) return std::nullopt;
  return value;
}

void coerceNumericFields(std::vector<StrokeRow>& rows) {
  for (auto& row : rows) {
    const std::string* distance = row.field(kDistanceGpsColumn);
    const std::string* rate = row.field(kStrokeRateColumn);
    row.distance_gps = distance ? parseOptionalNumber(*distance) : std::nullopt;
    row.stroke_rate = rate ? parseOptionalNumber(*rate) : std::nullopt;
  }
}

size_t suppressOutliers(std::vector<StrokeRow>& rows, const SanitizerConfig& cfg) {
  // jumps are measured on the distances as they were before this pass
  std::vector<std::optional<double>> distances;
  distances.reserve(rows.size());
  for (const auto& row : rows) distances.push_back(row.distance_gps);

  size_t suppressed = 0;
  for (size_t i = 0; i < rows.size(); ++i) {
    bool jump = i > 0 && distances[i] && distances[i - 1] &&
                *distances[i] - *distances[i - 1] > cfg.max_distance_jump;

    const auto& rate = rows[i].stroke_rate;
    bool bad_rate = rate && (*rate < cfg.min_stroke_rate || *rate > cfg.max_stroke_rate);

    if (jump || bad_rate) {
      rows[i].distance_gps.reset();
      rows[i].stroke_rate.reset();
      ++suppressed;
    }
  }
  return suppressed;
}

size_t sanitizeSession(std::vector<StrokeRow>& rows, const SanitizerConfig& cfg) {
  coerceNumericFields(rows);
  size_t suppressed = suppressOutliers(rows, cfg);
  spdlog::debug("sanitizer: {} of {} rows suppressed", suppressed, rows.size());
  return suppressed;
}
