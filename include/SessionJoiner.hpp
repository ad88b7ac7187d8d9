#pragma once
#include "IStrokeSource.hpp"
#include "PipelineConfig.hpp"
#include <string>
#include <vector>

struct Session {
  std::string id;
  std::vector<StrokeRow> rows;
};

struct SessionFailure {
  std::string path;
  std::string reason;
};

// Rows of all sessions in input order. Only Up/Down rows, each tagged
// with its session id.
struct Dataset {
  std::vector<StrokeRow> rows;
  std::vector<SessionFailure> failures;
};

// File name without directory and extension, e.g.
// "csv/SpdCoach 3039416 20250307 1205PM.csv" -> "SpdCoach 3039416 20250307 1205PM"
std::string sessionIdFor(const std::string& path);

class SessionJoiner {
public:
  explicit SessionJoiner(const PipelineConfig& cfg = PipelineConfig());

  // Drains source, discards its units row, then segments and sanitizes.
  Session processSession(IStrokeSource& source, const std::string& session_id) const;

  // Throws FormatError or std::runtime_error if the file can't be used
  Session loadSession(const std::string& path) const;

  // Failed files are logged, recorded in Dataset::failures and skipped.
  // Throws NoValidSessionsError if no file could be loaded.
  Dataset join(const std::vector<std::string>& paths) const;

private:
  PipelineConfig cfg_;
};
