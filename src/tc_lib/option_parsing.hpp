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
#ifndef OPTION_PARSING_H
#define OPTION_PARSING_H

#include "geometry.hpp"
#include "network.hpp"

#include <set>
#include <string>

// "south,west,north,east" in degrees
BoundingBox parseBoundingBox(const std::string& value);

// Comma separated highway values, e.g. "path,track"
std::set<TrailType> parseTrailTypes(const std::string& value);

#endif /* OPTION_PARSING_H */
