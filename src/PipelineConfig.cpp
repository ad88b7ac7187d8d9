#include "PipelineConfig.hpp"
#include "Errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

using nlohmann::json;

namespace {

const json& section(const json& j, const char* name) {
  static const json empty = json::object();
  if (!j.contains(name)) return empty;
  const json& s = j.at(name);
  if (!s.is_object()) throw ConfigError(std::string("'") + name + "' must be an object");
  return s;
}

} // namespace

PipelineConfig PipelineConfig::fromJson(const json& j) {
  if (!j.is_object()) throw ConfigError("Config must be a JSON object");

  PipelineConfig cfg;
  try {
    const json& seg = section(j, "segmenter");
    cfg.segmenter.turn_minute = seg.value("turn_minute", cfg.segmenter.turn_minute);
    cfg.segmenter.min_leg_strokes = seg.value("min_leg_strokes", cfg.segmenter.min_leg_strokes);

    const json& san = section(j, "sanitizer");
    cfg.sanitizer.max_distance_jump = san.value("max_distance_jump", cfg.sanitizer.max_distance_jump);
    cfg.sanitizer.min_stroke_rate = san.value("min_stroke_rate", cfg.sanitizer.min_stroke_rate);
    cfg.sanitizer.max_stroke_rate = san.value("max_stroke_rate", cfg.sanitizer.max_stroke_rate);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("Invalid config value: ") + e.what());
  }

  if (cfg.segmenter.min_leg_strokes < 0) {
    throw ConfigError("segmenter.min_leg_strokes must not be negative");
  }
  if (cfg.sanitizer.min_stroke_rate > cfg.sanitizer.max_stroke_rate) {
    throw ConfigError("sanitizer.min_stroke_rate exceeds sanitizer.max_stroke_rate");
  }
  return cfg;
}

PipelineConfig PipelineConfig::fromFile(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw ConfigError("Could not open config file: " + path);

  json j;
  try {
    f >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("Could not parse config file " + path + ": " + e.what());
  }
  return fromJson(j);
}
