#include "LegSegmenter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace {

// Reads [min_digits, max_digits] decimal digits starting at pos.
bool readDigits(const std::string& s, size_t& pos, size_t min_digits, size_t max_digits,
                int& out) {
  size_t start = pos;
  int value = 0;
  while (pos < s.size() && pos - start < max_digits && s[pos] >= '0' && s[pos] <= '9') {
    value = value * 10 + (s[pos] - '0');
    ++pos;
  }
  if (pos - start < min_digits) return false;
  out = value;
  return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) return false;
  ++pos;
  return true;
}

} // namespace

std::optional<int> parseSplitMinute(const std::string& text) {
  size_t pos = 0;
  int hours = 0, minutes = 0, seconds = 0, fraction = 0;

  if (!readDigits(text, pos, 1, 2, hours) || !expect(text, pos, ':')) return std::nullopt;
  if (!readDigits(text, pos, 1, 2, minutes) || !expect(text, pos, ':')) return std::nullopt;
  if (!readDigits(text, pos, 1, 2, seconds) || !expect(text, pos, '.')) return std::nullopt;
  if (!readDigits(text, pos, 1, 6, fraction)) return std::nullopt;
  if (pos != text.size()) return std::nullopt;

  if (hours > 23 || minutes > 59 || seconds > 61) return std::nullopt;
  return minutes;
}

SegmentStep advance(const SegmentationState& state, std::optional<int> minute,
                    const SegmenterConfig& cfg) {
  SegmentStep step{state, Direction::Turning};
  if (!minute) return step;

  SegmentationState& s = step.state;
  if (*minute > cfg.turn_minute && !s.pending_transition) {
    s.pending_transition = true;
  } else if (*minute <= cfg.turn_minute && s.pending_transition) {
    // short runs are rollover noise, not a real turnaround
    if (s.strokes_since_transition >= cfg.min_leg_strokes) {
      s.is_up = !s.is_up;
    }
    s.strokes_since_transition = 0;
    s.pending_transition = false;
  }

  if (!s.pending_transition) {
    s.strokes_since_transition++;
    step.direction = s.is_up ? Direction::Up : Direction::Down;
  }
  return step;
}

LegSegmenter::LegSegmenter(const SegmenterConfig& cfg) : cfg_(cfg) {}

Direction LegSegmenter::update(const StrokeRow& row) {
  std::optional<int> minute;
  if (const std::string* split = row.field(kSplitGpsColumn)) {
    minute = parseSplitMinute(*split);
  }

  SegmentStep step = advance(state_, minute, cfg_);
  state_ = step.state;
  return step.direction;
}

size_t segmentSession(std::vector<StrokeRow>& rows, const SegmenterConfig& cfg) {
  LegSegmenter segmenter(cfg);
  for (auto& row : rows) {
    row.direction = segmenter.update(row);
  }

  auto turning = std::remove_if(rows.begin(), rows.end(), [](const StrokeRow& r) {
    return r.direction == Direction::Turning;
  });
  size_t dropped = static_cast<size_t>(std::distance(turning, rows.end()));
  rows.erase(turning, rows.end());

  spdlog::debug("segmenter: {} rows kept, {} turning rows dropped", rows.size(), dropped);
  return dropped;
}
