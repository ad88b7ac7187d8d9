#include "DatasetWriter.hpp"

#include <ostream>

using nlohmann::ordered_json;

namespace {

ordered_json number(const std::optional<double>& v) {
  if (!v) return nullptr;
  return *v;
}

} // namespace

ordered_json toJson(const Dataset& dataset) {
  ordered_json out = ordered_json::array();
  for (const auto& row : dataset.rows) {
    ordered_json item = ordered_json::object();
    for (const auto& f : row.fields) {
      // replaced by the numeric fields below
      if (f.first == kDistanceGpsColumn || f.first == kStrokeRateColumn) continue;
      item[f.first] = f.second;
    }
    item["distanceGps"] = number(row.distance_gps);
    item["strokeRate"] = number(row.stroke_rate);
    item["direction"] = toString(row.direction);
    item["sessionId"] = row.session_id;
    out.push_back(std::move(item));
  }
  return out;
}

void writeJson(const Dataset& dataset, std::ostream& out) {
  out << toJson(dataset).dump(2) << '\n';
}
