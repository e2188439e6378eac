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
#include "segmenter.hpp"

#include <algorithm>

namespace {
Coordinate at(double lat, double lng) { return Coordinate{ Lat{ lat }, Lng{ lng } }; }

Way way(int64_t id, std::vector<Coordinate> coordinates)
{
  return Way{ id, TrailType::Path, std::nullopt, std::move(coordinates) };
}
}

TEST_CASE("Two ways sharing a node are split at that node")
{
  std::vector<Way> ways{ way(1, { at(0, 0), at(0, 1), at(0, 2) }), way(2, { at(0, 1), at(1, 1) }) };
  Diagnostics diagnostics;
  auto segments = segmentNetwork(ways, diagnostics);

  REQUIRE(segments.size() == 3);
  REQUIRE(segments[0].id() == SegmentId{ 1, 0 });
  REQUIRE(segments[0].coordinates() == std::vector<Coordinate>{ at(0, 0), at(0, 1) });
  REQUIRE(segments[1].id() == SegmentId{ 1, 1 });
  REQUIRE(segments[1].coordinates() == std::vector<Coordinate>{ at(0, 1), at(0, 2) });
  REQUIRE(segments[2].id() == SegmentId{ 2, 0 });
  REQUIRE(segments[2].coordinates() == std::vector<Coordinate>{ at(0, 1), at(1, 1) });
  REQUIRE(diagnostics.skippedWays == 0);
}

TEST_CASE("Shared nodes never end up inside a segment")
{
  std::vector<Way> ways{ way(10, { at(48.0, 9.0), at(48.001, 9.0), at(48.002, 9.0),
                           at(48.003, 9.0), at(48.004, 9.0) }),
    way(11, { at(48.002, 8.999), at(48.002, 9.0), at(48.002, 9.001) }) };
  Diagnostics diagnostics;
  auto segments = segmentNetwork(ways, diagnostics);
  REQUIRE(segments.size() == 4);

  for (const auto& segment : segments) {
    const auto& coords = segment.coordinates();
    for (size_t i = 1; i + 1 < coords.size(); ++i) {
      for (const auto& other : segments) {
        if (other.id() == segment.id())
          continue;
        const auto& otherCoords = other.coordinates();
        REQUIRE(std::find(otherCoords.begin(), otherCoords.end(), coords[i]) == otherCoords.end());
      }
    }
  }
}

TEST_CASE("Shared nodes are matched despite small jitter")
{
  std::vector<Way> ways{ way(1, { at(0, 0), at(0, 0.001), at(0, 0.002) }),
    way(2, { at(0.00000001, 0.00100002), at(0.001, 0.001) }) };
  Diagnostics diagnostics;
  REQUIRE(segmentNetwork(ways, diagnostics).size() == 3);
}

TEST_CASE("A way without shared nodes stays a single segment")
{
  std::vector<Way> ways{ way(5, { at(0, 0), at(0, 0.001), at(0.001, 0.001) }) };
  Diagnostics diagnostics;
  auto segments = segmentNetwork(ways, diagnostics);
  REQUIRE(segments.size() == 1);
  REQUIRE(segments[0].coordinates() == ways[0].coordinates);
  REQUIRE(segments[0].id() == SegmentId{ 5, 0 });
}

TEST_CASE("Ways starting or ending on a shared node yield no empty segments")
{
  std::vector<Way> ways{ way(1, { at(0, 0), at(0, 0.001) }), way(2, { at(0, 0.001), at(0, 0.002) }),
    way(3, { at(0, 0.001), at(0.001, 0.001) }) };
  Diagnostics diagnostics;
  auto segments = segmentNetwork(ways, diagnostics);
  REQUIRE(segments.size() == 3);
  for (const auto& segment : segments) {
    REQUIRE(segment.coordinates().size() == 2);
    REQUIRE(segment.length() > 0);
  }
}

TEST_CASE("Self intersecting ways are split at the repeated node")
{
  auto b = at(0, 0.001);
  std::vector<Way> ways{ way(7, { at(0, 0), b, at(0.001, 0.001), at(0.001, 0.002), b,
                                at(-0.001, 0.001) }) };
  Diagnostics diagnostics;
  auto segments = segmentNetwork(ways, diagnostics);
  REQUIRE(segments.size() == 3);
  REQUIRE(segments[0].coordinates().back() == b);
  REQUIRE(segments[1].coordinates().front() == b);
  REQUIRE(segments[1].coordinates().back() == b);
  REQUIRE(segments[2].coordinates().front() == b);
}

TEST_CASE("A closed loop stays one segment")
{
  std::vector<Way> ways{ way(3,
      { at(0, 0), at(0, 0.001), at(0.001, 0.001), at(0.001, 0), at(0, 0) }) };
  Diagnostics diagnostics;
  auto segments = segmentNetwork(ways, diagnostics);
  REQUIRE(segments.size() == 1);
  REQUIRE(segments[0].coordinates().size() == 5);
}

TEST_CASE("Malformed ways are skipped and counted")
{
  std::vector<Way> ways{ way(1, { at(0, 0) }), way(2, {}), way(3, { at(0, 0), at(0, 0) }),
    way(4, { at(0, 0), at(0, 0.001) }), way(4, { at(1, 0), at(1, 0.001) }) };
  Diagnostics diagnostics;
  auto segments = segmentNetwork(ways, diagnostics);
  REQUIRE(segments.size() == 1);
  REQUIRE(segments[0].id() == SegmentId{ 4, 0 });
  REQUIRE(diagnostics.skippedWays == 4);
  REQUIRE(diagnostics.warnings.size() == 4);
}

TEST_CASE("Consecutive duplicate nodes are collapsed")
{
  auto collapsed = collapseRepeatedNodes({ at(0, 0), at(0, 0), at(0, 1), at(0, 1), at(0, 0) });
  REQUIRE(collapsed == std::vector<Coordinate>{ at(0, 0), at(0, 1), at(0, 0) });
}

TEST_CASE("Segmentation is deterministic for any number of workers")
{
  std::vector<Way> ways;
  for (int64_t i = 0; i < 50; ++i) {
    ways.push_back(way(i, { at(0.001 * i, 0), at(0.001 * i, 0.001), at(0.001 * i, 0.002) }));
  }
  ways.push_back(way(100, { at(0, 0.001), at(0.025, 0.001), at(0.049, 0.001) }));

  Diagnostics first;
  Diagnostics second;
  auto single = segmentNetwork(ways, first, 1);
  auto parallel = segmentNetwork(ways, second, 4);
  REQUIRE(single == parallel);
  REQUIRE(single.size() > ways.size());
}
