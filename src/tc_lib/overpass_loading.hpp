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
#ifndef OVERPASS_LOADING_H
#define OVERPASS_LOADING_H

#include "network.hpp"

#include <istream>
#include <set>
#include <string>
#include <vector>

const std::set<TrailType> DEFAULT_TRAIL_TYPES{ TrailType::Path, TrailType::Track,
  TrailType::Footway };

/*
  Reads the ways of an Overpass JSON response. Geometry is taken from inline "geometry" arrays
  (out geom) or resolved from "nodes" against the node elements of the same response. Ways whose
  highway tag is not in `types` are dropped, everything else is handed on unvalidated.
  Throws std::runtime_error if the input is not an Overpass response.
*/
std::vector<Way> parseOverpassJson(std::istream& in, const std::set<TrailType>& types);

std::vector<Way> loadWaysFromOverpassFile(const std::string& path, bool zipped,
    const std::set<TrailType>& types = DEFAULT_TRAIL_TYPES);

#endif /* OVERPASS_LOADING_H */
