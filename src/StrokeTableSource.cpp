#include "StrokeTableSource.hpp"
#include "Errors.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <stdexcept>

namespace {

using CsvTokenizer = boost::tokenizer<boost::escaped_list_separator<char>>;

// Power, force, heart-rate, position and imperial-unit duplicates
const char* const kDroppedColumns[] = {
  "Distance (IMP)", "Split (IMP)", "Speed (IMP)", "Distance/Stroke (IMP)",
  "Heart Rate", "Power", "Catch", "Slip", "Finish", "Wash",
  "Force Avg", "Work", "Force Max", "Max Force Angle",
  "GPS Lat.", "GPS Lon.",
};

bool isDropped(const std::string& name) {
  if (name.empty()) return true;
  return std::find(std::begin(kDroppedColumns), std::end(kDroppedColumns), name) !=
         std::end(kDroppedColumns);
}

std::vector<std::string> splitCells(const std::string& line, size_t line_no) {
  // No escape character, double quotes only
  boost::escaped_list_separator<char> sep(std::string(), std::string(","), std::string("\""));
  std::vector<std::string> cells;
  try {
    CsvTokenizer tok(line, sep);
    for (const auto& cell : tok) {
      cells.push_back(boost::algorithm::trim_copy(cell));
    }
  } catch (const boost::escaped_list_error& e) {
    throw FormatError("Malformed CSV on line " + std::to_string(line_no) + ": " + e.what());
  }
  return cells;
}

bool isMarker(std::string line) {
  boost::algorithm::trim(line);
  boost::algorithm::trim_right_if(line, boost::algorithm::is_any_of(","));
  boost::algorithm::trim_right(line);
  return line == kPerStrokeMarker;
}

bool isBlank(const std::string& line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

StrokeTableSource::StrokeTableSource(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open session file: " + path);
  parse(f);
}

StrokeTableSource::StrokeTableSource(std::istream& in) {
  parse(in);
}

void StrokeTableSource::parse(std::istream& in) {
  std::string line;
  size_t line_no = 0;

  bool found = false;
  while (std::getline(in, line)) {
    ++line_no;
    if (isMarker(line)) {
      found = true;
      break;
    }
  }
  if (!found) throw FormatError(std::string("Missing '") + kPerStrokeMarker + "' section");

  std::vector<std::string> header;
  while (std::getline(in, line)) {
    ++line_no;
    if (isBlank(line)) continue;
    header = splitCells(line, line_no);
    break;
  }
  if (header.empty()) throw FormatError("Per-stroke table has no header");

  std::vector<size_t> kept;
  for (size_t i = 0; i < header.size(); ++i) {
    if (!isDropped(header[i])) {
      kept.push_back(i);
      columns_.push_back(header[i]);
    }
  }

  for (const char* required : {kSplitGpsColumn, kDistanceGpsColumn, kStrokeRateColumn}) {
    if (std::find(columns_.begin(), columns_.end(), required) == columns_.end()) {
      throw FormatError(std::string("Per-stroke table lacks column '") + required + "'");
    }
  }

  while (std::getline(in, line)) {
    ++line_no;
    if (isBlank(line)) continue;

    auto cells = splitCells(line, line_no);
    if (cells.size() > header.size()) {
      // trailing empty cells are tolerated, real data past the header is not
      bool extra_data = std::any_of(cells.begin() + header.size(), cells.end(),
                                    [](const std::string& c) { return !c.empty(); });
      if (extra_data) {
        throw FormatError("Line " + std::to_string(line_no) + " has " +
                          std::to_string(cells.size()) + " cells, header has " +
                          std::to_string(header.size()));
      }
    }
    cells.resize(header.size());

    StrokeRow row;
    row.fields.reserve(kept.size());
    for (size_t i : kept) {
      row.fields.emplace_back(header[i], std::move(cells[i]));
    }
    rows_.push_back(std::move(row));
  }
}

bool StrokeTableSource::next(StrokeRow& out) {
  if (idx_ >= rows_.size()) return false;
  out = rows_[idx_++];
  return true;
}
