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
#ifndef GRID_H
#define GRID_H

#include "geometry.hpp"

#include <optional>
#include <vector>

/*
  Uniform grid over recorded GPS samples. Points are stored sorted by cell with an offset array
  per cell. Every cell is at least `cellSize` meters wide and high everywhere in the bounding
  box, so all points within `cellSize` of a query lie in its cell or one of the 8 neighbours.
  The grid is immutable after construction and may be queried from several threads.
*/
class Grid {
  public:
  static constexpr size_t MAX_CELLS = size_t{ 1 } << 24;

  Grid() = delete;
  Grid(const std::vector<Coordinate>& points, double cellSize = 10.0, size_t maxCells = MAX_CELLS);
  Grid(const Grid& other) = default;
  Grid(Grid&& other) noexcept = default;
  virtual ~Grid() noexcept = default;
  Grid& operator=(const Grid& other) = default;
  Grid& operator=(Grid&& other) noexcept = default;

  bool hasPointWithin(const Coordinate& c, double radius) const;
  size_t countPointsWithin(const Coordinate& c, double radius) const;

  std::optional<size_t> cellOf(const Coordinate& c) const;

  const BoundingBox& bounding_box() const;
  size_t pointCount() const;
  size_t cellCount() const;
  long rowCount() const;
  long columnCount() const;
  double cellSize() const;

  protected:
  private:
  void layout(double cellSize);
  long row(Lat lat) const;
  long column(Lng lng) const;
  size_t coordsToIndex(const Coordinate& c) const;

  template <typename Visitor> void visitCandidates(const Coordinate& c, double radius, Visitor v) const;

  BoundingBox bBox;
  std::vector<Coordinate> points;
  std::vector<size_t> offset;
  double cellSize_;
  double cellLat = 0;
  double cellLng = 0;
  long rows = 0;
  long cols = 0;
};

#endif /* GRID_H */
