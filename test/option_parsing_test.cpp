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
#include "option_parsing.hpp"

TEST_CASE("Bounding box is given as south,west,north,east")
{
  auto box = parseBoundingBox("47.5,8.25,48,9.75");
  REQUIRE(box.lat_min.get() == 47.5);
  REQUIRE(box.lng_min.get() == 8.25);
  REQUIRE(box.lat_max.get() == 48.0);
  REQUIRE(box.lng_max.get() == 9.75);
}

TEST_CASE("Malformed bounding boxes throw")
{
  REQUIRE_THROWS_AS(parseBoundingBox(""), std::invalid_argument);
  REQUIRE_THROWS_AS(parseBoundingBox("1,2,3"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseBoundingBox("1,2,3,4,5"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseBoundingBox("south,2,3,4"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseBoundingBox("1,2x,3,4"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseBoundingBox("3,2,1,4"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseBoundingBox("1,2,95,4"), std::invalid_argument);
}

TEST_CASE("Trail types are parsed from a comma list")
{
  REQUIRE(parseTrailTypes("path") == std::set<TrailType>{ TrailType::Path });
  REQUIRE(parseTrailTypes("track,footway,track")
      == std::set<TrailType>{ TrailType::Track, TrailType::Footway });
  REQUIRE(parseTrailTypes("other") == std::set<TrailType>{ TrailType::Other });
}

TEST_CASE("Unknown trail types throw")
{
  REQUIRE_THROWS_AS(parseTrailTypes("path,motorway"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseTrailTypes(""), std::invalid_argument);
}
