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
#include "cell_overlay.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {
double spanInCells(double extent, double delta)
{
  return std::max(1.0, std::ceil(extent / delta));
}
}

CellOverlay::CellOverlay(const std::vector<Segment>& segments, const CoverageResult& coverage,
    double cellSize, const BoundingBox& region, size_t maxCells)
    : region_(region)
{
  if (!(cellSize > 0)) {
    throw std::invalid_argument("Overlay cell size has to be positive");
  }
  if (maxCells == 0) {
    throw std::invalid_argument("Overlay needs at least one cell");
  }
  if (region_.empty()) {
    region_ = BoundingBox{ Lat{ 0 }, Lng{ 0 }, Lat{ 0 }, Lng{ 0 } };
  }

  layout(cellSize);
  while (static_cast<double>(config_.columns) * static_cast<double>(config_.rows) > maxCells) {
    const double factor
        = std::sqrt(static_cast<double>(config_.columns) * config_.rows / maxCells);
    layout(config_.cellSize * std::max(factor, 1.25));
  }
  if (config_.cellSize != cellSize) {
    std::cout << "..."
              << "overlay would exceed " << maxCells << " cells, raised cell size to "
              << config_.cellSize << "m" << '\n';
  }

  segmentCells_.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    const auto& segment = segments[i];
    const auto entry = coverage.find(segment.id());
    const bool covered = entry && entry->state == CoverageState::Covered;

    std::vector<size_t> ids;
    for (const auto& c : interpolate(segment.coordinates(), OVERLAY_DISCRETIZATION)) {
      if (auto id = cellAt(c)) {
        ids.push_back(*id);
      }
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    const double kmPerCell = ids.empty() ? 0 : segment.length() / 1000 / ids.size();
    for (auto id : ids) {
      auto [it, inserted] = cellIndex_.try_emplace(id, cells_.size());
      if (inserted) {
        OverlayCell cell;
        cell.id = id;
        cell.row = id / config_.columns;
        cell.column = id % config_.columns;
        cells_.push_back(std::move(cell));
      }
      auto& cell = cells_[it->second];
      cell.hasTrail = true;
      cell.trailKm += kmPerCell;
      if (covered) {
        cell.coveredKm += kmPerCell;
        cell.visited = true;
      }
      cell.segments.push_back(i);
    }
    segmentCells_.push_back(std::move(ids));
  }

  std::sort(cells_.begin(), cells_.end(),
      [](const auto& a, const auto& b) { return a.id < b.id; });
  for (size_t i = 0; i < cells_.size(); ++i) {
    cellIndex_[cells_[i].id] = i;
  }

  auto trailCells = trailCellCount();
  auto visitedCells = visitedCellCount();
  std::cout << "..."
            << "overlay of " << config_.columns << "x" << config_.rows << " cells, " << trailCells
            << " with trails, " << visitedCells << " visited" << '\n';
}

void CellOverlay::layout(double cellSize)
{
  const double centerLat = (region_.lat_min + region_.lat_max) / 2;
  config_.cellSize = cellSize;
  config_.originLat = region_.lat_min;
  config_.originLng = region_.lng_min;
  config_.dlat = cellSize / EARTH_RADIUS / RADIANS_CONVERSION;
  config_.dlng = cellSize / (EARTH_RADIUS * std::cos(centerLat * RADIANS_CONVERSION))
      / RADIANS_CONVERSION;

  // Compared in double first, a huge span would not fit into size_t
  const double columns = spanInCells(region_.lng_max - region_.lng_min, config_.dlng);
  const double rows = spanInCells(region_.lat_max - region_.lat_min, config_.dlat);
  const double limit = static_cast<double>(std::numeric_limits<uint32_t>::max());
  config_.columns = static_cast<size_t>(std::min(columns, limit));
  config_.rows = static_cast<size_t>(std::min(rows, limit));
}

const OverlayConfig& CellOverlay::config() const { return config_; }
const BoundingBox& CellOverlay::region() const { return region_; }
const std::vector<OverlayCell>& CellOverlay::cells() const { return cells_; }

const OverlayCell* CellOverlay::cell(size_t id) const
{
  auto it = cellIndex_.find(id);
  if (it == cellIndex_.end()) {
    return nullptr;
  }
  return &cells_[it->second];
}

size_t CellOverlay::cellCount() const { return config_.columns * config_.rows; }
const std::vector<std::vector<size_t>>& CellOverlay::segmentCells() const
{
  return segmentCells_;
}

std::optional<size_t> CellOverlay::cellAt(const Coordinate& c) const
{
  if (!region_.contains_point(c)) {
    return {};
  }
  auto column = static_cast<size_t>(std::floor((c.lng - config_.originLng) / config_.dlng));
  auto row = static_cast<size_t>(std::floor((c.lat - config_.originLat) / config_.dlat));
  // the east and north border belong to the last cell
  column = std::min(column, config_.columns - 1);
  row = std::min(row, config_.rows - 1);
  return row * config_.columns + column;
}

BoundingBox CellOverlay::cellBox(const OverlayCell& cell) const
{
  const double south = config_.originLat + cell.row * config_.dlat;
  const double west = config_.originLng + cell.column * config_.dlng;
  return BoundingBox{ Lat{ south }, Lng{ west }, Lat{ south + config_.dlat },
    Lng{ west + config_.dlng } };
}

size_t CellOverlay::trailCellCount() const
{
  return std::count_if(
      cells_.begin(), cells_.end(), [](const auto& cell) { return cell.hasTrail; });
}

size_t CellOverlay::visitedCellCount() const
{
  return std::count_if(
      cells_.begin(), cells_.end(), [](const auto& cell) { return cell.visited; });
}

BoundingBox networkBoundingBox(const std::vector<Segment>& segments)
{
  BoundingBox box;
  for (const auto& segment : segments) {
    for (const auto& c : segment.coordinates()) {
      box.addCoordinate(c);
    }
  }
  return box;
}
