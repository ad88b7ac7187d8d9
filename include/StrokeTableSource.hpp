#pragma once
#include "IStrokeSource.hpp"
#include <iosfwd>
#include <string>
#include <vector>

inline constexpr const char* kPerStrokeMarker = "Per-Stroke Data:";

// Reads the per-stroke table of a SpdCoach CSV export.
// Everything before the "Per-Stroke Data:" line is session metadata and is
// skipped. Throws FormatError if the marker or the required columns are missing.
class StrokeTableSource : public IStrokeSource {
public:
  explicit StrokeTableSource(const std::string& path);
  explicit StrokeTableSource(std::istream& in);

  bool next(StrokeRow& out) override;

  // Kept column names, in file order
  const std::vector<std::string>& columns() const { return columns_; }
  size_t size() const { return rows_.size(); }

private:
  void parse(std::istream& in);

  std::vector<std::string> columns_;
  std::vector<StrokeRow> rows_;
  size_t idx_ = 0;
};
