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
#include "parameters.hpp"

#include <stdexcept>
#include <string>

void Parameters::validate() const
{
  if (!(matchRadius > 0)) {
    throw std::invalid_argument("match radius has to be positive, got " + std::to_string(matchRadius));
  }
  if (!(trackSpacing > 0)) {
    throw std::invalid_argument(
        "track sample spacing has to be positive, got " + std::to_string(trackSpacing));
  }
  if (!(segmentSpacing > 0)) {
    throw std::invalid_argument(
        "segment sample spacing has to be positive, got " + std::to_string(segmentSpacing));
  }
  if (!(coverageThreshold >= 0 && coverageThreshold <= 1)) {
    throw std::invalid_argument(
        "coverage threshold has to be within [0, 1], got " + std::to_string(coverageThreshold));
  }
  if (cellSize < 0) {
    throw std::invalid_argument("cell size must not be negative, got " + std::to_string(cellSize));
  }
}
