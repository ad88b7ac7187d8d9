#include "SessionJoiner.hpp"
#include "Errors.hpp"
#include "StrokeTableSource.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;

std::string sessionIdFor(const std::string& path) {
  fs::path p(path);
  std::string id = p.stem().string();
  if (id.empty()) id = p.filename().string();
  if (id.empty()) id = path;
  return id;
}

SessionJoiner::SessionJoiner(const PipelineConfig& cfg) : cfg_(cfg) {}

Session SessionJoiner::processSession(IStrokeSource& source, const std::string& session_id) const {
  if (session_id.empty()) throw std::invalid_argument("Session id must not be empty");

  Session session;
  session.id = session_id;

  StrokeRow row;
  bool units_row = true;
  while (source.next(row)) {
    // first data row holds the device's unit labels
    if (units_row) {
      units_row = false;
      continue;
    }
    session.rows.push_back(std::move(row));
  }

  size_t turning = segmentSession(session.rows, cfg_.segmenter);
  size_t suppressed = sanitizeSession(session.rows, cfg_.sanitizer);

  size_t up = 0;
  for (auto& r : session.rows) {
    r.session_id = session.id;
    if (r.direction == Direction::Up) ++up;
  }

  spdlog::info("session '{}': {} up, {} down, {} turning dropped, {} suppressed",
               session.id, up, session.rows.size() - up, turning, suppressed);
  return session;
}

Session SessionJoiner::loadSession(const std::string& path) const {
  StrokeTableSource source(path);
  return processSession(source, sessionIdFor(path));
}

Dataset SessionJoiner::join(const std::vector<std::string>& paths) const {
  Dataset dataset;
  size_t loaded = 0;

  for (const auto& path : paths) {
    Session session;
    try {
      session = loadSession(path);
    } catch (const std::runtime_error& e) {
      spdlog::warn("skipping '{}': {}", path, e.what());
      dataset.failures.push_back({path, e.what()});
      continue;
    }

    ++loaded;
    dataset.rows.insert(dataset.rows.end(),
                        std::make_move_iterator(session.rows.begin()),
                        std::make_move_iterator(session.rows.end()));
  }

  if (loaded == 0) {
    throw NoValidSessionsError(paths.empty()
                                   ? "No session files given"
                                   : "None of the " + std::to_string(paths.size()) +
                                         " session files could be loaded");
  }
  return dataset;
}
