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
#include <catch2/catch.hpp>
#include "track.hpp"

namespace {
Coordinate at(double lat, double lng) { return Coordinate{ Lat{ lat }, Lng{ lng } }; }
}

TEST_CASE("Tracks know their extent")
{
  Track track{ "run.gpx#0/0", { at(48.0, 9.0), at(48.1, 9.2) }, 5 };
  REQUIRE(track.size() == 2);
  REQUIRE(track.boundingBox().lat_max.get() == 48.1);
  REQUIRE(track.touches(BoundingBox{ Lat{ 48.05 }, Lng{ 9.1 }, Lat{ 48.2 }, Lng{ 9.3 } }));
  REQUIRE(!track.touches(BoundingBox{ Lat{ 48.01 }, Lng{ 9.01 }, Lat{ 48.09 }, Lng{ 9.19 } }));

  Track empty{ "empty.gpx#0/0", {} };
  REQUIRE(empty.empty());
  REQUIRE(sampleTrack(empty, 2).empty());
}
