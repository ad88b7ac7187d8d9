#include "Errors.hpp"
#include "StrokeTableSource.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace {

const char* kExport =
    "Session Summary:\n"
    "Name,Total Distance\n"
    "Morning row,2000\n"
    "\n"
    "Per-Stroke Data:\n"
    "Interval,Distance (GPS),Distance (IMP),Split (GPS),Stroke Rate,Heart Rate,Power,GPS Lat.,GPS Lon.\n"
    "(Interval),(Meters),(Meters),(/500),(SPM),(BPM),(Watts),(Degrees),(Degrees)\n"
    "1,4.2,4.2,00:02:10.3,22.5,130,---,51.5,-0.1\n"
    "1,12.0,12.0,00:02:08.1,23.0,131,---,51.5,-0.1\n";

std::string fieldOf(const StrokeRow& row, const std::string& name) {
  const std::string* v = row.field(name);
  return v ? *v : "<absent>";
}

} // namespace

TEST(StrokeTableSource, SkipsPreambleAndDropsUnusedColumns) {
  std::istringstream in(kExport);
  StrokeTableSource source(in);

  const std::vector<std::string> expected{"Interval", "Distance (GPS)", "Split (GPS)", "Stroke Rate"};
  EXPECT_EQ(source.columns(), expected);
  // units row is still part of the table
  EXPECT_EQ(source.size(), 3u);

  StrokeRow row;
  ASSERT_TRUE(source.next(row));
  EXPECT_EQ(fieldOf(row, "Distance (GPS)"), "(Meters)");

  ASSERT_TRUE(source.next(row));
  EXPECT_EQ(row.fields.size(), 4u);
  EXPECT_EQ(fieldOf(row, "Split (GPS)"), "00:02:10.3");
  EXPECT_EQ(fieldOf(row, "Stroke Rate"), "22.5");
  EXPECT_EQ(fieldOf(row, "Heart Rate"), "<absent>");
  EXPECT_EQ(row.direction, Direction::Turning);

  ASSERT_TRUE(source.next(row));
  EXPECT_EQ(fieldOf(row, "Distance (GPS)"), "12.0");
  EXPECT_FALSE(source.next(row));
}

TEST(StrokeTableSource, MissingMarkerIsFormatError) {
  std::istringstream in("Interval,Distance (GPS),Split (GPS),Stroke Rate\n1,2,00:02:00.0,20\n");
  EXPECT_THROW(StrokeTableSource source(in), FormatError);
}

TEST(StrokeTableSource, MarkerToleratesCarriageReturnAndTrailingCommas) {
  std::istringstream in(
      "Per-Stroke Data:,,,\r\n"
      "\r\n"
      "Distance (GPS),Split (GPS),Stroke Rate\r\n"
      "10,00:02:00.0,20\r\n");
  StrokeTableSource source(in);

  StrokeRow row;
  ASSERT_TRUE(source.next(row));
  EXPECT_EQ(fieldOf(row, "Stroke Rate"), "20");
}

TEST(StrokeTableSource, EmptyTableIsFormatError) {
  std::istringstream in("Per-Stroke Data:\n\n");
  EXPECT_THROW(StrokeTableSource source(in), FormatError);
}

TEST(StrokeTableSource, MissingRequiredColumnIsFormatError) {
  std::istringstream in("Per-Stroke Data:\nDistance (GPS),Stroke Rate\n10,20\n");
  EXPECT_THROW(StrokeTableSource source(in), FormatError);
}

TEST(StrokeTableSource, QuotedCellsAndShortRows) {
  std::istringstream in(
      "Per-Stroke Data:\n"
      "Note,Distance (GPS),Split (GPS),Stroke Rate\n"
      "\"start, easy\",10,00:02:00.0\n");
  StrokeTableSource source(in);

  StrokeRow row;
  ASSERT_TRUE(source.next(row));
  EXPECT_EQ(fieldOf(row, "Note"), "start, easy");
  EXPECT_EQ(fieldOf(row, "Stroke Rate"), "");
}

TEST(StrokeTableSource, ExtraDataCellsAreFormatError) {
  std::istringstream in(
      "Per-Stroke Data:\n"
      "Distance (GPS),Split (GPS),Stroke Rate\n"
      "10,00:02:00.0,20,,\n"
      "10,00:02:00.0,20,99\n");
  EXPECT_THROW(StrokeTableSource source(in), FormatError);
}

TEST(StrokeTableSource, UnreadableFileThrows) {
  EXPECT_THROW(StrokeTableSource source(std::string("/nonexistent/dir/session.csv")),
               std::runtime_error);
}
