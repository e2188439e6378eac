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
#ifndef CELL_OVERLAY_H
#define CELL_OVERLAY_H

#include "classifier.hpp"
#include "network.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

const double DEFAULT_OVERLAY_CELL_SIZE = 200;
const double OVERLAY_DISCRETIZATION = 20;
// Upper bound on columns * rows so that cell ids stay exact in a double
const size_t MAX_OVERLAY_CELLS = size_t{ 1 } << 40;

struct OverlayConfig {
  double cellSize;
  Lat originLat;
  Lng originLng;
  double dlat;
  double dlng;
  size_t columns;
  size_t rows;
};

struct OverlayCell {
  size_t id;
  size_t row;
  size_t column;
  bool hasTrail = false;
  bool visited = false;
  double trailKm = 0;
  double coveredKm = 0;
  // Positions in the segment vector the overlay was built from
  std::vector<size_t> segments;
};

/*
  Coarse summary grid over a region. Every segment is discretized every 20m and the cells it
  passes through share its length evenly. A cell is visited if a covered segment passes
  through it. Not to be confused with Grid, the fine index used for matching.
*/
class CellOverlay {
  public:
  CellOverlay(const std::vector<Segment>& segments, const CoverageResult& coverage,
      double cellSize, const BoundingBox& region, size_t maxCells = MAX_OVERLAY_CELLS);

  const OverlayConfig& config() const;
  const BoundingBox& region() const;
  // Cells with trails, sorted by id
  const std::vector<OverlayCell>& cells() const;
  const OverlayCell* cell(size_t id) const;
  size_t cellCount() const;
  // Sorted cell ids per segment
  const std::vector<std::vector<size_t>>& segmentCells() const;

  std::optional<size_t> cellAt(const Coordinate& c) const;
  BoundingBox cellBox(const OverlayCell& cell) const;

  size_t trailCellCount() const;
  size_t visitedCellCount() const;

  private:
  void layout(double cellSize);

  OverlayConfig config_;
  BoundingBox region_;
  std::vector<OverlayCell> cells_;
  std::unordered_map<size_t, size_t> cellIndex_;
  std::vector<std::vector<size_t>> segmentCells_;
};

// Bounding box of all segment coordinates.
BoundingBox networkBoundingBox(const std::vector<Segment>& segments);

#endif /* CELL_OVERLAY_H */
