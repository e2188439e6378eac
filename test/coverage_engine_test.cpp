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
#include "coverage_engine.hpp"

namespace {
Coordinate at(double lat, double lng) { return Coordinate{ Lat{ lat }, Lng{ lng } }; }

std::vector<Way> network()
{
  return { Way{ 1, TrailType::Path, std::string{ "Ridge" },
               { at(48.0, 9.0), at(48.0, 9.005), at(48.0, 9.01) } },
    Way{ 2, TrailType::Footway, std::nullopt, { at(48.0, 9.005), at(48.005, 9.005) } },
    Way{ 3, TrailType::Track, std::nullopt, { at(48.01, 9.0) } } };
}

std::vector<Track> tracks()
{
  std::vector<Track> result;
  result.emplace_back("a.gpx#0/0", std::vector<Coordinate>{ at(48.0, 8.9999), at(48.0, 9.0049) }, 1);
  result.emplace_back("a.gpx#0/1", std::vector<Coordinate>{}, 1);
  result.emplace_back("b.gpx#0/0",
      std::vector<Coordinate>{ at(48.0001, 9.005), at(48.0021, 9.005) }, 2);
  return result;
}
}

TEST_CASE("Engine classifies every segment")
{
  Cache cache{ std::make_shared<NullCacheStore>() };
  CoverageEngine engine{ Parameters{}, cache };
  auto report = engine.run(network(), tracks());

  REQUIRE(report.segments.size() == 3);
  REQUIRE(report.coverage.size() == 3);
  REQUIRE(report.usedTracks == 2);
  REQUIRE(report.trackSamples > 0);
  REQUIRE(report.diagnostics.skippedWays == 1);
  REQUIRE(report.diagnostics.skippedTracks == 1);

  for (const auto& segment : report.segments) {
    auto entry = report.coverage.find(segment.id());
    REQUIRE(entry);
    REQUIRE(entry->fraction >= 0);
    REQUIRE(entry->fraction <= 1);
    REQUIRE(segment.state() == entry->state);
  }
  REQUIRE(report.coverage.find(SegmentId{ 1, 0 })->state == CoverageState::Covered);
  REQUIRE(report.coverage.find(SegmentId{ 1, 1 })->state == CoverageState::Uncovered);
  REQUIRE(report.coverage.find(SegmentId{ 1, 1 })->fraction < 0.05);
  // b.gpx covers a bit less than half of way 2
  REQUIRE(report.coverage.find(SegmentId{ 2, 0 })->state == CoverageState::Uncovered);
  REQUIRE(report.coverage.find(SegmentId{ 2, 0 })->fraction > 0.3);
}

TEST_CASE("Cached reruns equal uncached runs")
{
  Cache uncached{ std::make_shared<NullCacheStore>() };
  auto expected = CoverageEngine{ Parameters{}, uncached }.run(network(), tracks());

  auto store = std::make_shared<MemoryCacheStore>();
  Cache cache{ store };
  CoverageEngine engine{ Parameters{}, cache };

  auto first = engine.run(network(), tracks());
  REQUIRE(first.coverage == expected.coverage);
  REQUIRE(first.diagnostics.cacheHits == 0);
  // network, two tracks and the coverage
  REQUIRE(store->size() == 4);

  auto second = engine.run(network(), tracks());
  REQUIRE(second.coverage == expected.coverage);
  REQUIRE(second.segments == expected.segments);
  REQUIRE(second.diagnostics.cacheHits == 2);
  REQUIRE(second.diagnostics.cacheMisses == 0);
  REQUIRE(second.trackSamples == 0);
  REQUIRE(second.diagnostics.skippedWays == 1);
}

TEST_CASE("Corrupt cache entries do not change the result")
{
  Cache uncached{ std::make_shared<NullCacheStore>() };
  auto expected = CoverageEngine{ Parameters{}, uncached }.run(network(), tracks());

  auto store = std::make_shared<MemoryCacheStore>();
  Cache cache{ store };
  CoverageEngine engine{ Parameters{}, cache };
  engine.run(network(), tracks());

  for (const auto& key : store->keys()) {
    store->write(key, "garbage");
  }

  auto report = engine.run(network(), tracks());
  REQUIRE(report.coverage == expected.coverage);
  REQUIRE(report.diagnostics.cacheCorrupt == 4);
  REQUIRE(report.diagnostics.cacheHits == 0);
}

TEST_CASE("Changed parameters or tracks miss the coverage cache")
{
  auto store = std::make_shared<MemoryCacheStore>();
  Cache cache{ store };
  CoverageEngine{ Parameters{}, cache }.run(network(), tracks());

  Parameters wider;
  wider.matchRadius = 20;
  auto report = CoverageEngine{ wider, cache }.run(network(), tracks());
  // network and tracks are reused, the coverage is recomputed
  REQUIRE(report.diagnostics.cacheHits == 3);
  REQUIRE(report.diagnostics.cacheMisses == 1);

  auto moreTracks = tracks();
  moreTracks.emplace_back("c.gpx#0/0", std::vector<Coordinate>{ at(48.0, 9.006) }, 3);
  auto withMore = CoverageEngine{ Parameters{}, cache }.run(network(), moreTracks);
  REQUIRE(withMore.diagnostics.cacheMisses == 2);
  REQUIRE(withMore.usedTracks == 3);
}

TEST_CASE("Coverage fingerprint ignores the order of tracks")
{
  Parameters parameters;
  Fingerprint network{ 1 };
  auto a = CoverageEngine::fingerprintCoverage(network, { Fingerprint{ 2 }, Fingerprint{ 3 } }, parameters);
  auto b = CoverageEngine::fingerprintCoverage(network, { Fingerprint{ 3 }, Fingerprint{ 2 } }, parameters);
  parameters.coverageThreshold = 0.6;
  auto c = CoverageEngine::fingerprintCoverage(network, { Fingerprint{ 2 }, Fingerprint{ 3 } }, parameters);
  REQUIRE(a.get() == b.get());
  REQUIRE(a.get() != c.get());
}

TEST_CASE("Engine rejects invalid parameters")
{
  Cache cache{ std::make_shared<NullCacheStore>() };
  Parameters parameters;
  parameters.coverageThreshold = 1.5;
  REQUIRE_THROWS_AS(CoverageEngine(parameters, cache), std::invalid_argument);
  parameters.coverageThreshold = 0.5;
  parameters.matchRadius = 0;
  REQUIRE_THROWS_AS(CoverageEngine(parameters, cache), std::invalid_argument);
}
