/*
  Trail-coverage determines which trail segments were covered by GPS tracks.
  Copyright (C) 2018  Florian Barth

  This program is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  This program is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/
#include "export.hpp"
#include "loginfo.hpp"

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace fs = boost::filesystem;

namespace {

Json::Value position(Lat lat, Lng lng)
{
  Json::Value js_pos(Json::arrayValue);
  js_pos.append(lng.get());
  js_pos.append(lat.get());
  return js_pos;
}

Json::Value boxToJson(const BoundingBox& box)
{
  Json::Value bbox(Json::arrayValue);
  bbox.append(box.lng_min.get());
  bbox.append(box.lat_min.get());
  bbox.append(box.lng_max.get());
  bbox.append(box.lat_max.get());
  return bbox;
}

Json::Value featureCollection(Json::Value&& features)
{
  Json::Value collection;
  collection["type"] = "FeatureCollection";
  collection["features"] = std::move(features);
  return collection;
}
}

double roundTo(double value, double unit) { return std::round(value / unit) * unit; }

Json::Value segmentsToJson(
    const std::vector<Segment>& segments, const CoverageResult& coverage,
    const CellOverlay& overlay)
{
  Json::Value features(Json::arrayValue);
  const auto& segmentCells = overlay.segmentCells();

  for (size_t i = 0; i < segments.size(); ++i) {
    const auto& segment = segments[i];
    Json::Value js_segment;
    js_segment["type"] = "Feature";

    Json::Value geometry;
    geometry["type"] = "LineString";
    Json::Value coordinates(Json::arrayValue);
    for (const auto& c : segment.coordinates()) {
      coordinates.append(position(c.lat, c.lng));
    }
    geometry["coordinates"] = coordinates;
    js_segment["geometry"] = geometry;

    const auto entry = coverage.find(segment.id());
    const double fraction = entry ? entry->fraction : 0.0;

    Json::Value properties;
    properties["id"] = to_string(segment.id());
    properties["way"] = static_cast<Json::Int64>(segment.id().way);
    properties["type"] = trailTypeName(segment.type());
    if (segment.name()) {
      properties["name"] = *segment.name();
    }
    properties["length_m"] = roundTo(segment.length(), 0.1);
    properties["coverage_pct"] = roundTo(fraction, 0.01);
    properties["state"] = coverageStateName(entry ? entry->state : segment.state());
    properties["covered"] = entry && entry->state == CoverageState::Covered;

    Json::Value cells(Json::arrayValue);
    if (i < segmentCells.size()) {
      for (auto id : segmentCells[i]) {
        cells.append(static_cast<Json::UInt64>(id));
      }
    }
    properties["cells"] = cells;
    js_segment["properties"] = properties;

    features.append(js_segment);
  }
  return featureCollection(std::move(features));
}

Json::Value cellsToJson(const CellOverlay& overlay)
{
  Json::Value features(Json::arrayValue);
  for (const auto& cell : overlay.cells()) {
    if (!cell.hasTrail)
      continue;

    const auto box = overlay.cellBox(cell);
    Json::Value ring(Json::arrayValue);
    ring.append(position(box.lat_min, box.lng_min));
    ring.append(position(box.lat_min, box.lng_max));
    ring.append(position(box.lat_max, box.lng_max));
    ring.append(position(box.lat_max, box.lng_min));
    ring.append(position(box.lat_min, box.lng_min));

    Json::Value geometry;
    geometry["type"] = "Polygon";
    geometry["coordinates"].append(ring);

    Json::Value properties;
    properties["id"] = static_cast<Json::UInt64>(cell.id);
    properties["has_trail"] = cell.hasTrail;
    properties["visited"] = cell.visited;
    properties["trail_km"] = roundTo(cell.trailKm, 0.001);
    properties["covered_km"] = roundTo(cell.coveredKm, 0.001);
    Json::Value segmentIds(Json::arrayValue);
    for (auto s : cell.segments) {
      segmentIds.append(static_cast<Json::UInt64>(s));
    }
    properties["segment_ids"] = segmentIds;

    Json::Value js_cell;
    js_cell["type"] = "Feature";
    js_cell["geometry"] = geometry;
    js_cell["properties"] = properties;
    features.append(js_cell);
  }
  return featureCollection(std::move(features));
}

Json::Value summaryToJson(const CoverageReport& report, const CellOverlay& overlay)
{
  const auto& coverage = report.coverage;
  Json::Value summary;
  summary["segments"] = static_cast<Json::UInt64>(coverage.size());
  summary["covered_segments"] = static_cast<Json::UInt64>(coverage.coveredCount());
  summary["total_km"] = roundTo(coverage.totalLength() / 1000, 0.001);
  summary["covered_km"] = roundTo(coverage.coveredLength() / 1000, 0.001);
  summary["covered_pct"] = coverage.totalLength() > 0
      ? roundTo(coverage.coveredLength() / coverage.totalLength() * 100, 0.01)
      : 0.0;
  summary["tracks"] = static_cast<Json::UInt64>(report.usedTracks);
  summary["track_samples"] = static_cast<Json::UInt64>(report.trackSamples);
  summary["trail_cells"] = static_cast<Json::UInt64>(overlay.trailCellCount());
  summary["visited_cells"] = static_cast<Json::UInt64>(overlay.visitedCellCount());

  const auto& d = report.diagnostics;
  Json::Value diagnostics;
  diagnostics["skipped_ways"] = static_cast<Json::UInt64>(d.skippedWays);
  diagnostics["skipped_tracks"] = static_cast<Json::UInt64>(d.skippedTracks);
  diagnostics["cache_hits"] = static_cast<Json::UInt64>(d.cacheHits);
  diagnostics["cache_misses"] = static_cast<Json::UInt64>(d.cacheMisses);
  diagnostics["cache_corrupt"] = static_cast<Json::UInt64>(d.cacheCorrupt);
  Json::Value warnings(Json::arrayValue);
  for (const auto& w : d.warnings) {
    warnings.append(w);
  }
  diagnostics["warnings"] = warnings;
  summary["diagnostics"] = diagnostics;
  return summary;
}

Json::Value coverageToJson(const CoverageReport& report, const CellOverlay& overlay, bool writeLogs)
{
  Json::Value result;
  result["bbox"] = boxToJson(overlay.region());

  const auto& config = overlay.config();
  Json::Value grid;
  grid["cell_size_m"] = config.cellSize;
  grid["origin"] = position(config.originLat, config.originLng);
  grid["dlat"] = config.dlat;
  grid["dlon"] = config.dlng;
  grid["cols"] = static_cast<Json::UInt64>(config.columns);
  grid["rows"] = static_cast<Json::UInt64>(config.rows);
  result["grid"] = grid;

  result["segments"] = segmentsToJson(report.segments, report.coverage, overlay);
  result["cells"] = cellsToJson(overlay);
  result["summary"] = summaryToJson(report, overlay);

  if (writeLogs) {
    auto log = Logger::getInstance();
    result["debug"] = log->getInfo();
  }
  return result;
}

void writeJsonFile(const std::string& path, const Json::Value& value)
{
  fs::path file{ path };
  if (file.has_parent_path()) {
    fs::create_directories(file.parent_path());
  }

  fs::ofstream out{ file };
  if (!out) {
    throw std::runtime_error("Could not open " + path + " for writing");
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  writer->write(value, &out);
  out << '\n';
  if (!out) {
    throw std::runtime_error("Failed to write " + path);
  }

  std::cout << "Exported coverage to " << path << '\n';
}
