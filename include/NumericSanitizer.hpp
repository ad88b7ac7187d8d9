#pragma once
#include "StrokeRow.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SanitizerConfig {
  double max_distance_jump = 100.0;  // meters between consecutive strokes
  double min_stroke_rate = 10.0;
  double max_stroke_rate = 34.0;
};

// Number in text, or nullopt when the text is empty, unparsable or not finite.
std::optional<double> parseOptionalNumber(const std::string& text);

// Fills distance_gps and stroke_rate from the row's raw cells.
void coerceNumericFields(std::vector<StrokeRow>& rows);

// Nulls distance and rate on rows with a GPS jump or an implausible rate.
// Rows themselves are kept. Returns the number of rows suppressed.
size_t suppressOutliers(std::vector<StrokeRow>& rows, const SanitizerConfig& cfg);

// coerceNumericFields followed by suppressOutliers
size_t sanitizeSession(std::vector<StrokeRow>& rows, const SanitizerConfig& cfg);
