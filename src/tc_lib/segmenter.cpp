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
#include "segmenter.hpp"
#include "workers.hpp"

#include <chrono>
#include <iostream>
#include <iterator>
#include <unordered_map>

using ms = std::chrono::milliseconds;

std::vector<Coordinate> collapseRepeatedNodes(const std::vector<Coordinate>& coordinates)
{
  std::vector<Coordinate> result;
  result.reserve(coordinates.size());
  for (const auto& c : coordinates) {
    if (result.empty() || !(quantize(result.back()) == quantize(c))) {
      result.push_back(c);
    }
  }
  return result;
}

SplitPoints findSplitPoints(const std::vector<const Way*>& ways)
{
  std::unordered_map<CoordinateKey, uint32_t, CoordinateKeyHash> wayCount;
  SplitPoints splitPoints;

  for (const auto* way : ways) {
    std::unordered_set<CoordinateKey, CoordinateKeyHash> seen;
    seen.reserve(way->coordinates.size());
    for (const auto& c : way->coordinates) {
      auto key = quantize(c);
      if (!seen.insert(key).second) {
        splitPoints.insert(key);
        continue;
      }
      if (++wayCount[key] == 2) {
        splitPoints.insert(key);
      }
    }
  }
  return splitPoints;
}

std::vector<Segment> splitWay(const Way& way, const SplitPoints& splitPoints)
{
  const auto& nodes = way.coordinates;
  std::vector<Segment> segments;
  std::vector<Coordinate> current{ nodes.front() };
  uint32_t ordinal = 0;

  for (size_t i = 1; i < nodes.size(); ++i) {
    current.push_back(nodes[i]);
    const bool interior = i + 1 < nodes.size();
    if (interior && splitPoints.find(quantize(nodes[i])) != splitPoints.end()) {
      segments.emplace_back(SegmentId{ way.id, ordinal++ }, way.type, way.name, std::move(current));
      current = std::vector<Coordinate>{ nodes[i] };
    }
  }
  segments.emplace_back(SegmentId{ way.id, ordinal }, way.type, way.name, std::move(current));
  return segments;
}

std::vector<Segment> segmentNetwork(
    const std::vector<Way>& ways, Diagnostics& diagnostics, size_t threads)
{
  auto start = std::chrono::high_resolution_clock::now();

  std::vector<Way> cleaned;
  cleaned.reserve(ways.size());
  std::unordered_set<int64_t> ids;
  for (const auto& way : ways) {
    if (!ids.insert(way.id).second) {
      ++diagnostics.skippedWays;
      diagnostics.warn("skipping way " + std::to_string(way.id) + ": duplicate way id");
      continue;
    }
    auto nodes = collapseRepeatedNodes(way.coordinates);
    if (nodes.size() < 2) {
      ++diagnostics.skippedWays;
      diagnostics.warn("skipping way " + std::to_string(way.id)
          + ": fewer than two distinct coordinates");
      continue;
    }
    cleaned.push_back(Way{ way.id, way.type, way.name, std::move(nodes) });
  }

  std::vector<const Way*> wayPointers;
  wayPointers.reserve(cleaned.size());
  for (const auto& way : cleaned) {
    wayPointers.push_back(&way);
  }
  const auto splitPoints = findSplitPoints(wayPointers);

  std::vector<std::vector<Segment>> perWay(cleaned.size());
  parallelFor(cleaned.size(), threads,
      [&](size_t i) { perWay[i] = splitWay(cleaned[i], splitPoints); });

  std::vector<Segment> segments;
  for (auto& waySegments : perWay) {
    std::move(waySegments.begin(), waySegments.end(), std::back_inserter(segments));
  }

  auto end = std::chrono::high_resolution_clock::now();
  std::cout << "..."
            << "split " << cleaned.size() << " ways at " << splitPoints.size()
            << " shared nodes into " << segments.size() << " segments in "
            << std::chrono::duration_cast<ms>(end - start).count() << "ms" << '\n';
  return segments;
}
