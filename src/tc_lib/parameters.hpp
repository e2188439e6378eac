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
#ifndef PARAMETERS_H
#define PARAMETERS_H

#include <cstddef>

// Tunables of a coverage run. Distances are in meters.
struct Parameters {
  double matchRadius = 10.0;
  double trackSpacing = 2.0;
  double segmentSpacing = 5.0;
  double coverageThreshold = 0.5;
  // 0 uses the match radius
  double cellSize = 0.0;
  // 0 uses one worker per hardware thread
  size_t threads = 0;

  double effectiveCellSize() const { return cellSize > 0 ? cellSize : matchRadius; }

  // Throws std::invalid_argument naming the first offending value.
  void validate() const;
};

#endif /* PARAMETERS_H */
