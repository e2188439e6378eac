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
#ifndef TRACK_H
#define TRACK_H

#include "geometry.hpp"

#include <cstdint>
#include <string>
#include <vector>

// One recorded activity, e.g. a single trkseg of a GPX file.
class Track {
  public:
  Track() = default;
  Track(std::string source, std::vector<Coordinate>&& points, int64_t modified = 0);
  Track(const Track& other) = default;
  Track(Track&& other) noexcept = default;
  virtual ~Track() noexcept = default;
  Track& operator=(const Track& other) = default;
  Track& operator=(Track&& other) noexcept = default;

  const std::string& source() const;
  const std::vector<Coordinate>& points() const;
  int64_t modified() const;
  const BoundingBox& boundingBox() const;

  bool empty() const;
  size_t size() const;

  // True if at least one recorded point lies inside the region.
  bool touches(const BoundingBox& region) const;

  private:
  std::string source_;
  std::vector<Coordinate> points_;
  int64_t modified_ = 0;
  BoundingBox bBox;
};

std::vector<Coordinate> sampleTrack(const Track& track, double spacing);

#endif /* TRACK_H */
