#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

inline constexpr const char* kSplitGpsColumn = "Split (GPS)";
inline constexpr const char* kDistanceGpsColumn = "Distance (GPS)";
inline constexpr const char* kStrokeRateColumn = "Stroke Rate";

enum class Direction { Up, Down, Turning };

inline const char* toString(Direction d) {
  switch (d) {
    case Direction::Up:   return "up";
    case Direction::Down: return "down";
    default:              return "turning";
  }
}

struct StrokeRow {
  // Raw cells in header order (dropped columns already removed)
  std::vector<std::pair<std::string, std::string>> fields;

  std::optional<double> distance_gps;   // meters
  std::optional<double> stroke_rate;    // strokes per minute
  Direction direction = Direction::Turning;
  std::string session_id;

  // nullptr if the column is not present in this row
  const std::string* field(const std::string& name) const {
    for (const auto& f : fields) {
      if (f.first == name) return &f.second;
    }
    return nullptr;
  }
};
