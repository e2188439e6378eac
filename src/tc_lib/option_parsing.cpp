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
#include "option_parsing.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace {
double parseDegrees(const std::string& value)
{
  size_t read = 0;
  double result;
  try {
    result = std::stod(value, &read);
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Illegal coordinate \"" + value + "\" in bounding box");
  }
  if (read != value.size()) {
    throw std::invalid_argument("Illegal coordinate \"" + value + "\" in bounding box");
  }
  return result;
}
}

BoundingBox parseBoundingBox(const std::string& value)
{
  std::vector<double> values;
  std::istringstream ss(value);
  for (std::string part; std::getline(ss, part, ',');) {
    values.push_back(parseDegrees(part));
  }
  if (values.size() != 4) {
    throw std::invalid_argument(
        "Illegal format for bounding box. Expected \"south,west,north,east\"");
  }

  BoundingBox box{ Lat{ values[0] }, Lng{ values[1] }, Lat{ values[2] }, Lng{ values[3] } };
  if (box.empty()) {
    throw std::invalid_argument("Bounding box " + value + " has south > north or west > east");
  }
  if (box.lat_min < -90 || box.lat_max > 90 || box.lng_min < -180 || box.lng_max > 180) {
    throw std::invalid_argument("Bounding box " + value + " is out of range");
  }
  return box;
}

std::set<TrailType> parseTrailTypes(const std::string& value)
{
  std::set<TrailType> result;
  std::istringstream ss(value);
  for (std::string type; std::getline(ss, type, ',');) {
    auto parsed = trailTypeFromTag(type);
    if (parsed == TrailType::Other && type != "other") {
      throw std::invalid_argument("Unknown trail type \"" + type + "\"");
    }
    result.insert(parsed);
  }
  if (result.empty()) {
    throw std::invalid_argument("No trail types given");
  }
  return result;
}
