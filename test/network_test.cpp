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
#include "network.hpp"

#include <stdexcept>

namespace {
Coordinate at(double lat, double lng) { return Coordinate{ Lat{ lat }, Lng{ lng } }; }
}

TEST_CASE("Segments need two coordinates")
{
  REQUIRE_THROWS_AS(Segment(SegmentId{ 1, 0 }, TrailType::Path, std::nullopt,
                        std::vector<Coordinate>{ at(0, 0) }),
      std::invalid_argument);

  Segment segment{ SegmentId{ 1, 2 }, TrailType::Track, std::string{ "Ridge" },
    std::vector<Coordinate>{ at(0, 0), at(0, 0.001) } };
  REQUIRE(segment.state() == CoverageState::Unclassified);
  REQUIRE(segment.length() == Approx(0.001 * METERS_PER_DEGREE));
  REQUIRE(to_string(segment.id()) == "1/2");
}

TEST_CASE("Segment samples point back to their segment")
{
  Segment segment{ SegmentId{ 4, 0 }, TrailType::Path, std::nullopt,
    std::vector<Coordinate>{ at(0, 0), at(0, 0.001) } };
  auto samples = sampleSegment(segment, 5);
  REQUIRE(samples.size() == 24);
  for (const auto& sample : samples) {
    REQUIRE(sample.segment == &segment);
  }
  REQUIRE(samples.front().coordinate == at(0, 0));
  REQUIRE(samples.back().coordinate == at(0, 0.001));
}

TEST_CASE("Segment ids order by way and ordinal")
{
  REQUIRE(SegmentId{ 1, 5 } < SegmentId{ 2, 0 });
  REQUIRE(SegmentId{ 2, 0 } < SegmentId{ 2, 1 });
  REQUIRE(!(SegmentId{ 2, 1 } < SegmentId{ 2, 1 }));
  REQUIRE(std::hash<SegmentId>{}(SegmentId{ 2, 1 }) == std::hash<SegmentId>{}(SegmentId{ 2, 1 }));
}

TEST_CASE("Trail types map from highway tags")
{
  REQUIRE(trailTypeFromTag("path") == TrailType::Path);
  REQUIRE(trailTypeFromTag("track") == TrailType::Track);
  REQUIRE(trailTypeFromTag("footway") == TrailType::Footway);
  REQUIRE(trailTypeFromTag("motorway") == TrailType::Other);
  REQUIRE(trailTypeName(TrailType::Footway) == "footway");
}
