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
#ifndef GEOMETRY_H
#define GEOMETRY_H

#include "namedType.hpp"

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <vector>

using Lat = NamedType<double, struct LatParameter>;
using Lng = NamedType<double, struct LngParameter>;

const double EARTH_RADIUS = 6371007.2;
const double RADIANS_CONVERSION = M_PI / 180;
const double METERS_PER_DEGREE = EARTH_RADIUS * RADIANS_CONVERSION;

// Shared nodes of different ways are matched after rounding to this many degrees.
const double QUANTIZATION = 1e-6;

struct Coordinate {
  Lat lat;
  Lng lng;

  Coordinate() = default;
  Coordinate(Lat lat, Lng lng)
      : lat(lat)
      , lng(lng)
  {
  }

  bool operator==(const Coordinate& other) const
  {
    return lat.get() == other.lat.get() && lng.get() == other.lng.get();
  }
  bool operator!=(const Coordinate& other) const { return !(*this == other); }

  private:
  friend class boost::serialization::access;
  template <class Archive> void serialize(Archive& ar, const unsigned int /*version*/)
  {
    ar& lat;
    ar& lng;
  }
};

std::ostream& operator<<(std::ostream& os, const Coordinate& c);

struct CoordinateKey {
  int64_t lat;
  int64_t lng;

  bool operator==(const CoordinateKey& other) const
  {
    return lat == other.lat && lng == other.lng;
  }
};

struct CoordinateKeyHash {
  size_t operator()(const CoordinateKey& key) const;
};

CoordinateKey quantize(const Coordinate& c);

struct BoundingBox {
  Lat lat_min = Lat(std::numeric_limits<double>::max());
  Lat lat_max = Lat(std::numeric_limits<double>::lowest());
  Lng lng_min = Lng(std::numeric_limits<double>::max());
  Lng lng_max = Lng(std::numeric_limits<double>::lowest());

  BoundingBox() = default;
  BoundingBox(Lat lat_min, Lng lng_min, Lat lat_max, Lng lng_max)
      : lat_min(lat_min)
      , lat_max(lat_max)
      , lng_min(lng_min)
      , lng_max(lng_max)
  {
  }

  void addCoordinate(const Coordinate& c)
  {
    if (c.lat < lat_min) {
      lat_min = c.lat;
    }
    if (c.lat > lat_max) {
      lat_max = c.lat;
    }
    if (c.lng < lng_min) {
      lng_min = c.lng;
    }
    if (c.lng > lng_max) {
      lng_max = c.lng;
    }
  }

  void addBox(const BoundingBox& other)
  {
    if (other.empty()) {
      return;
    }
    addCoordinate(Coordinate{ other.lat_min, other.lng_min });
    addCoordinate(Coordinate{ other.lat_max, other.lng_max });
  }

  bool empty() const { return lat_min > lat_max || lng_min > lng_max; }

  bool contains_point(Lat lat, Lng lng) const
  {
    return lat_min <= lat && lat <= lat_max && lng_min <= lng && lng <= lng_max;
  }

  bool contains_point(const Coordinate& c) const { return contains_point(c.lat, c.lng); }
};

double haversine_distance(const Coordinate& a, const Coordinate& b);

// Sum of the haversine distances between consecutive points.
double pathLength(const std::vector<Coordinate>& path);

/*
  Samples a path every `spacing` meters of arc length. Samples are linear in lat and lng between
  the two bracketing points. The first and the last point of the path are always part of the
  result. Throws std::invalid_argument for a spacing that is not positive.
*/
std::vector<Coordinate> interpolate(const std::vector<Coordinate>& path, double spacing);

#endif /* GEOMETRY_H */
