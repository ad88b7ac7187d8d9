#include "Errors.hpp"
#include "PipelineConfig.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using nlohmann::json;

TEST(PipelineConfig, EmptyDocumentKeepsDefaults) {
  PipelineConfig cfg = PipelineConfig::fromJson(json::object());
  EXPECT_EQ(cfg.segmenter.turn_minute, 12);
  EXPECT_EQ(cfg.segmenter.min_leg_strokes, 8);
  EXPECT_DOUBLE_EQ(cfg.sanitizer.max_distance_jump, 100.0);
  EXPECT_DOUBLE_EQ(cfg.sanitizer.min_stroke_rate, 10.0);
  EXPECT_DOUBLE_EQ(cfg.sanitizer.max_stroke_rate, 34.0);
}

TEST(PipelineConfig, OverridesPresentKeysOnly) {
  json j = json::parse(R"({
    "segmenter": { "turn_minute": 10, "min_leg_strokes": 5 },
    "sanitizer": { "max_stroke_rate": 40.5 }
  })");
  PipelineConfig cfg = PipelineConfig::fromJson(j);

  EXPECT_EQ(cfg.segmenter.turn_minute, 10);
  EXPECT_EQ(cfg.segmenter.min_leg_strokes, 5);
  EXPECT_DOUBLE_EQ(cfg.sanitizer.max_distance_jump, 100.0);
  EXPECT_DOUBLE_EQ(cfg.sanitizer.max_stroke_rate, 40.5);
}

TEST(PipelineConfig, RejectsBadDocuments) {
  EXPECT_THROW(PipelineConfig::fromJson(json::array()), ConfigError);
  EXPECT_THROW(PipelineConfig::fromJson(json::parse(R"({"segmenter": 3})")), ConfigError);
  EXPECT_THROW(PipelineConfig::fromJson(json::parse(R"({"segmenter": {"turn_minute": "twelve"}})")),
               ConfigError);
  EXPECT_THROW(PipelineConfig::fromJson(json::parse(R"({"segmenter": {"min_leg_strokes": -1}})")),
               ConfigError);
  EXPECT_THROW(PipelineConfig::fromJson(
                   json::parse(R"({"sanitizer": {"min_stroke_rate": 30, "max_stroke_rate": 20}})")),
               ConfigError);
}

TEST(PipelineConfig, LoadsFromFile) {
  auto path = std::filesystem::temp_directory_path() / "strokelegs_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"sanitizer": {"max_distance_jump": 50}})";
  }
  PipelineConfig cfg = PipelineConfig::fromFile(path.string());
  std::filesystem::remove(path);

  EXPECT_DOUBLE_EQ(cfg.sanitizer.max_distance_jump, 50.0);
  EXPECT_EQ(cfg.segmenter.turn_minute, 12);
}

TEST(PipelineConfig, FileErrorsAreConfigErrors) {
  EXPECT_THROW(PipelineConfig::fromFile("/nonexistent/strokelegs.json"), ConfigError);

  auto path = std::filesystem::temp_directory_path() / "strokelegs_config_broken.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(PipelineConfig::fromFile(path.string()), ConfigError);
  std::filesystem::remove(path);
}
