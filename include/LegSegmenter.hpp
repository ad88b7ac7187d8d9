#pragma once
#include "StrokeRow.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct SegmenterConfig {
  int turn_minute = 12;      // split minute above this means a turn is coming
  int min_leg_strokes = 8;   // confirmed strokes needed before a turn flips the leg
};

struct SegmentationState {
  bool is_up = true;
  bool pending_transition = true;   // session lead-in counts as a turn
  int strokes_since_transition = 0;
};

struct SegmentStep {
  SegmentationState state;
  Direction direction = Direction::Turning;
};

// Minute field of a "HH:MM:SS.ffffff" split, or nullopt if the text is malformed.
std::optional<int> parseSplitMinute(const std::string& text);

// One step of the scan. An unreadable minute leaves the state untouched
// and yields Turning.
SegmentStep advance(const SegmentationState& state, std::optional<int> minute,
                    const SegmenterConfig& cfg);

class LegSegmenter {
public:
  explicit LegSegmenter(const SegmenterConfig& cfg = SegmenterConfig());

  // Classifies the next row of the session
  Direction update(const StrokeRow& row);

  const SegmentationState& state() const { return state_; }

private:
  SegmenterConfig cfg_;
  SegmentationState state_;
};

// Labels every row of one session in order, then erases the Turning rows.
// Returns how many rows were erased.
size_t segmentSession(std::vector<StrokeRow>& rows, const SegmenterConfig& cfg);
