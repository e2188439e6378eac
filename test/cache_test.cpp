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
#include "cache.hpp"
#include "classifier.hpp"

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace {
std::vector<Coordinate> somePath()
{
  return { { Lat{ 48.1 }, Lng{ 9.1 } }, { Lat{ 48.2 }, Lng{ 9.2 } }, { Lat{ 48.3 }, Lng{ 9.15 } } };
}

struct TempDir {
  fs::path path = fs::temp_directory_path() / fs::unique_path("trailcover-%%%%-%%%%-%%%%");
  ~TempDir()
  {
    boost::system::error_code ec;
    fs::remove_all(path, ec);
  }
};
}

TEST_CASE("Cache computes once and then hits")
{
  auto store = std::make_shared<MemoryCacheStore>();
  Cache cache{ store };
  size_t computed = 0;
  auto compute = [&]() {
    ++computed;
    return somePath();
  };

  auto first = cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 7 }, compute);
  auto second = cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 7 }, compute);
  REQUIRE(first == somePath());
  REQUIRE(second == first);
  REQUIRE(computed == 1);
  REQUIRE(cache.hits() == 1);
  REQUIRE(cache.misses() == 1);
  REQUIRE(store->size() == 1);
}

TEST_CASE("Different kinds and keys do not collide")
{
  auto store = std::make_shared<MemoryCacheStore>();
  Cache cache{ store };
  cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 1 }, somePath);
  cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 2 }, somePath);
  cache.getOrCompute<std::vector<Coordinate>>("network", Fingerprint{ 1 }, somePath);
  REQUIRE(store->size() == 3);
  REQUIRE(cache.misses() == 3);
}

TEST_CASE("Garbage and truncated entries are recomputed")
{
  auto store = std::make_shared<MemoryCacheStore>();
  Cache cache{ store };
  const Fingerprint key{ 99 };
  const auto entry = Cache::entryKey("track", key);

  SECTION("garbage")
  {
    store->write(entry, "definitely not gzip");
  }
  SECTION("truncated")
  {
    auto bytes = Cache::encode(somePath(), "track", key);
    store->write(entry, bytes.substr(0, bytes.size() / 2));
  }
  SECTION("empty")
  {
    store->write(entry, "");
  }
  SECTION("written for another key")
  {
    store->write(entry, Cache::encode(somePath(), "track", Fingerprint{ 100 }));
  }

  auto value = cache.getOrCompute<std::vector<Coordinate>>("track", key, somePath);
  REQUIRE(value == somePath());
  REQUIRE(cache.corrupt() == 1);
  REQUIRE(cache.misses() == 1);
  REQUIRE(cache.hits() == 0);

  // the recomputed value replaced the broken entry
  REQUIRE(cache.getOrCompute<std::vector<Coordinate>>("track", key, somePath) == somePath());
  REQUIRE(cache.hits() == 1);
}

TEST_CASE("Coverage results survive the cache")
{
  std::vector<SegmentCoverage> entries(2);
  entries[0].id = SegmentId{ 3, 0 };
  entries[0].state = CoverageState::Covered;
  entries[0].fraction = 0.75;
  entries[0].length = 123.4;
  entries[0].samples = 4;
  entries[0].matched = 3;
  entries[1].id = SegmentId{ 3, 1 };
  entries[1].state = CoverageState::Uncovered;
  CoverageResult original{ std::move(entries) };

  auto bytes = Cache::encode(original, "coverage", Fingerprint{ 5 });
  auto restored = Cache::decode<CoverageResult>(bytes, "coverage", Fingerprint{ 5 });
  REQUIRE(restored == original);
  REQUIRE(restored.find(SegmentId{ 3, 0 })->fraction == 0.75);
}

TEST_CASE("File store persists entries across cache instances")
{
  TempDir dir;
  size_t computed = 0;
  auto compute = [&]() {
    ++computed;
    return somePath();
  };

  {
    Cache cache{ std::make_shared<FileCacheStore>(dir.path) };
    cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 11 }, compute);
  }
  {
    Cache cache{ std::make_shared<FileCacheStore>(dir.path) };
    auto value = cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 11 }, compute);
    REQUIRE(value == somePath());
    REQUIRE(cache.hits() == 1);
  }
  REQUIRE(computed == 1);
  REQUIRE(fs::exists(FileCacheStore{ dir.path }.pathOf(Cache::entryKey("track", Fingerprint{ 11 }))));
}

TEST_CASE("Invalidating drops every entry")
{
  TempDir dir;
  auto store = std::make_shared<FileCacheStore>(dir.path);
  Cache cache{ store };
  cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 1 }, somePath);
  cache.getOrCompute<std::vector<Coordinate>>("coverage", Fingerprint{ 2 }, somePath);
  REQUIRE(store->read(Cache::entryKey("track", Fingerprint{ 1 })));

  cache.invalidate();
  REQUIRE(!store->read(Cache::entryKey("track", Fingerprint{ 1 })));
  REQUIRE(!store->read(Cache::entryKey("coverage", Fingerprint{ 2 })));

  cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 1 }, somePath);
  REQUIRE(cache.misses() == 3);
}

TEST_CASE("Invalidating skips entries that cannot be removed")
{
  TempDir dir;
  auto store = std::make_shared<FileCacheStore>(dir.path);
  Cache cache{ store };
  cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 1 }, somePath);

  // a non-empty directory with an entry name can not be removed with fs::remove
  const auto stuck = store->pathOf(Cache::entryKey("network", Fingerprint{ 1 }));
  fs::create_directories(stuck / "child");

  REQUIRE_NOTHROW(cache.invalidate());
  REQUIRE(fs::is_directory(stuck));
  REQUIRE(!store->read(Cache::entryKey("track", Fingerprint{ 1 })));
  REQUIRE(!store->read(Cache::entryKey("network", Fingerprint{ 1 })));
}

TEST_CASE("Invalidating a missing cache directory does nothing")
{
  TempDir dir;
  Cache cache{ std::make_shared<FileCacheStore>(dir.path / "absent") };
  REQUIRE_NOTHROW(cache.invalidate());
  REQUIRE(!fs::exists(dir.path / "absent"));
}

TEST_CASE("Null store never hits")
{
  Cache cache{ std::make_shared<NullCacheStore>() };
  cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 1 }, somePath);
  cache.getOrCompute<std::vector<Coordinate>>("track", Fingerprint{ 1 }, somePath);
  REQUIRE(cache.hits() == 0);
  REQUIRE(cache.misses() == 2);
}

TEST_CASE("Fingerprints depend on content and order")
{
  auto a = FingerprintBuilder{}.add(somePath()).finish();
  auto b = FingerprintBuilder{}.add(somePath()).finish();
  auto path = somePath();
  std::swap(path[0], path[1]);
  auto c = FingerprintBuilder{}.add(path).finish();
  REQUIRE(a.get() == b.get());
  REQUIRE(a.get() != c.get());
  REQUIRE(to_hex(Fingerprint{ 255 }) == "00000000000000ff");
}
