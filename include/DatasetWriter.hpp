#pragma once
#include "SessionJoiner.hpp"
#include <nlohmann/json.hpp>
#include <iosfwd>

// One object per row: passthrough cells as strings, then distanceGps,
// strokeRate (null when missing), direction and sessionId.
nlohmann::ordered_json toJson(const Dataset& dataset);

void writeJson(const Dataset& dataset, std::ostream& out);
