#pragma once
#include "LegSegmenter.hpp"
#include "NumericSanitizer.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

struct PipelineConfig {
  SegmenterConfig segmenter;
  SanitizerConfig sanitizer;

  // Keys absent from the document keep their defaults.
  // Throws ConfigError on wrong types or inconsistent values.
  static PipelineConfig fromJson(const nlohmann::json& j);
  static PipelineConfig fromFile(const std::string& path);
};
