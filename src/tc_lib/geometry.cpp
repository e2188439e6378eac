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
#include "geometry.hpp"

#include <algorithm>
#include <boost/container_hash/hash.hpp>
#include <cmath>
#include <stdexcept>

namespace {
// Edges shorter than this do not advance the arc length.
const double MIN_EDGE_LENGTH = 1e-6;
}

std::ostream& operator<<(std::ostream& os, const Coordinate& c)
{
  os << "(" << c.lat.get() << ", " << c.lng.get() << ")";
  return os;
}

size_t CoordinateKeyHash::operator()(const CoordinateKey& key) const
{
  size_t seed = 0;
  boost::hash_combine(seed, key.lat);
  boost::hash_combine(seed, key.lng);
  return seed;
}

CoordinateKey quantize(const Coordinate& c)
{
  return CoordinateKey{ std::llround(c.lat / QUANTIZATION), std::llround(c.lng / QUANTIZATION) };
}

double haversine_distance(const Coordinate& a, const Coordinate& b)
{
  using namespace std;

  double theta1 = a.lat * RADIANS_CONVERSION;
  double theta2 = b.lat * RADIANS_CONVERSION;
  double deltaTheta = (b.lat - a.lat) * RADIANS_CONVERSION;
  double deltaLambda = (b.lng - a.lng) * RADIANS_CONVERSION;
  double e = pow(sin(deltaTheta / 2.0), 2)
      + std::cos(theta1) * std::cos(theta2) * pow(sin(deltaLambda / 2.0), 2);
  double c = 2.0 * asin(sqrt(std::min(e, 1.0)));
  return EARTH_RADIUS * c;
}

double pathLength(const std::vector<Coordinate>& path)
{
  double length = 0;
  for (size_t i = 1; i < path.size(); ++i) {
    length += haversine_distance(path[i - 1], path[i]);
  }
  return length;
}

std::vector<Coordinate> interpolate(const std::vector<Coordinate>& path, double spacing)
{
  if (!(spacing > 0)) {
    throw std::invalid_argument("Sample spacing has to be positive");
  }
  if (path.size() < 2) {
    return path;
  }

  std::vector<Coordinate> samples{ path.front() };
  double travelled = 0;
  size_t step = 1;

  for (size_t i = 0; i + 1 < path.size(); ++i) {
    const auto& from = path[i];
    const auto& to = path[i + 1];
    const double length = haversine_distance(from, to);
    if (length < MIN_EDGE_LENGTH) {
      continue;
    }

    double next = step * spacing;
    while (next <= travelled + length) {
      const double fraction = (next - travelled) / length;
      samples.emplace_back(Lat{ from.lat + (to.lat - from.lat) * fraction },
          Lng{ from.lng + (to.lng - from.lng) * fraction });
      ++step;
      next = step * spacing;
    }
    travelled += length;
  }

  if (samples.back() != path.back()) {
    samples.push_back(path.back());
  }
  return samples;
}
