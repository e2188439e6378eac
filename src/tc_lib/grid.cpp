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
#include "grid.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace {
// Cells are made slightly larger than requested to absorb rounding in the degree conversion.
const double CELL_SAFETY = 1.001;
const double MAX_LATITUDE = 89.9;

double cosOfLatitude(double lat)
{
  return std::cos(std::min(std::abs(lat), MAX_LATITUDE) * RADIANS_CONVERSION);
}

long reach(double extent, double cell)
{
  return std::max(1L, static_cast<long>(std::ceil(extent / cell - 1e-9)));
}
}

Grid::Grid(const std::vector<Coordinate>& points, double cellSize, size_t maxCells)
    : points(points)
    , cellSize_(cellSize)
{
  if (!(cellSize > 0)) {
    throw std::invalid_argument("Cell size has to be positive");
  }
  if (maxCells == 0) {
    throw std::invalid_argument("Grid needs at least one cell");
  }

  std::for_each(this->points.begin(), this->points.end(),
      [this](const auto& c) { this->bBox.addCoordinate(c); });

  if (this->points.empty()) {
    offset = std::vector<size_t>(1, 0);
    return;
  }

  layout(cellSize);
  while (static_cast<double>(rows) * static_cast<double>(cols) > maxCells) {
    const double factor = std::sqrt(static_cast<double>(rows) * cols / maxCells);
    layout(cellSize_ * std::max(factor, 1.25));
  }
  if (cellSize_ != cellSize) {
    std::cout << "..."
              << "grid would exceed " << maxCells << " cells, raised cell size to " << cellSize_
              << "m" << '\n';
  }

  std::stable_sort(this->points.begin(), this->points.end(),
      [this](const auto& a, const auto& b) { return coordsToIndex(a) < coordsToIndex(b); });

  offset = std::vector<size_t>(rows * cols + 1, 0);

  size_t current = 0;
  for (size_t i = 0; i < this->points.size(); ++i) {
    size_t newIndex = coordsToIndex(this->points[i]);
    if (newIndex != current) {
      for (size_t j = current + 1; j < newIndex + 1; ++j) {
        offset[j] = i;
      }
      current = newIndex;
    }
  }
  for (size_t i = current + 1; i < offset.size(); ++i) {
    offset[i] = this->points.size();
  }
}

void Grid::layout(double cellSize)
{
  cellSize_ = cellSize;
  const double maxAbsLat = std::max(std::abs(bBox.lat_min.get()), std::abs(bBox.lat_max.get()));
  cellLat = cellSize * CELL_SAFETY / METERS_PER_DEGREE;
  cellLng = cellSize * CELL_SAFETY / (METERS_PER_DEGREE * cosOfLatitude(maxAbsLat + cellLat));

  // A degenerate box (all points equal) still gets one cell
  rows = static_cast<long>(std::floor((bBox.lat_max - bBox.lat_min) / cellLat)) + 1;
  cols = static_cast<long>(std::floor((bBox.lng_max - bBox.lng_min) / cellLng)) + 1;
}

long Grid::row(Lat lat) const { return static_cast<long>(std::floor((lat - bBox.lat_min) / cellLat)); }

long Grid::column(Lng lng) const
{
  return static_cast<long>(std::floor((lng - bBox.lng_min) / cellLng));
}

size_t Grid::coordsToIndex(const Coordinate& c) const
{
  long y = std::clamp(row(c.lat), 0L, rows - 1);
  long x = std::clamp(column(c.lng), 0L, cols - 1);
  return y * cols + x;
}

std::optional<size_t> Grid::cellOf(const Coordinate& c) const
{
  if (points.empty()) {
    return {};
  }
  long y = row(c.lat);
  long x = column(c.lng);
  if (y < 0 || y >= rows || x < 0 || x >= cols) {
    return {};
  }
  return y * cols + x;
}

template <typename Visitor>
void Grid::visitCandidates(const Coordinate& c, double radius, Visitor v) const
{
  if (points.empty()) {
    return;
  }
  const double radiusDeg = radius / METERS_PER_DEGREE;
  const double maxAbsLat
      = std::max({ std::abs(c.lat.get()) + radiusDeg, std::abs(bBox.lat_min.get()),
          std::abs(bBox.lat_max.get()) });
  const long latReach = reach(radiusDeg, cellLat);
  const long lngReach
      = reach(radius * CELL_SAFETY / (METERS_PER_DEGREE * cosOfLatitude(maxAbsLat)), cellLng);

  const long y = row(c.lat);
  const long x = column(c.lng);
  const long yBegin = std::max(0L, y - latReach);
  const long yEnd = std::min(rows - 1, y + latReach);
  const long xBegin = std::max(0L, x - lngReach);
  const long xEnd = std::min(cols - 1, x + lngReach);

  for (long yi = yBegin; yi <= yEnd; ++yi) {
    for (long xi = xBegin; xi <= xEnd; ++xi) {
      const size_t index = yi * cols + xi;
      for (size_t i = offset[index]; i < offset[index + 1]; ++i) {
        if (!v(points[i])) {
          return;
        }
      }
    }
  }
}

bool Grid::hasPointWithin(const Coordinate& c, double radius) const
{
  bool found = false;
  visitCandidates(c, radius, [&](const Coordinate& candidate) {
    found = haversine_distance(c, candidate) <= radius;
    return !found;
  });
  return found;
}

size_t Grid::countPointsWithin(const Coordinate& c, double radius) const
{
  size_t count = 0;
  visitCandidates(c, radius, [&](const Coordinate& candidate) {
    if (haversine_distance(c, candidate) <= radius) {
      ++count;
    }
    return true;
  });
  return count;
}

const BoundingBox& Grid::bounding_box() const { return bBox; }
size_t Grid::pointCount() const { return points.size(); }
size_t Grid::cellCount() const { return rows * cols; }
long Grid::rowCount() const { return rows; }
long Grid::columnCount() const { return cols; }
double Grid::cellSize() const { return cellSize_; }
