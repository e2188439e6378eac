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
#include "track.hpp"

#include <algorithm>

Track::Track(std::string source, std::vector<Coordinate>&& points, int64_t modified)
    : source_(std::move(source))
    , points_(std::move(points))
    , modified_(modified)
{
  std::for_each(
      points_.begin(), points_.end(), [this](const auto& c) { this->bBox.addCoordinate(c); });
}

const std::string& Track::source() const { return source_; }
const std::vector<Coordinate>& Track::points() const { return points_; }
int64_t Track::modified() const { return modified_; }
const BoundingBox& Track::boundingBox() const { return bBox; }

bool Track::empty() const { return points_.empty(); }
size_t Track::size() const { return points_.size(); }

bool Track::touches(const BoundingBox& region) const
{
  return std::any_of(points_.begin(), points_.end(),
      [&region](const auto& c) { return region.contains_point(c); });
}

std::vector<Coordinate> sampleTrack(const Track& track, double spacing)
{
  return interpolate(track.points(), spacing);
}
