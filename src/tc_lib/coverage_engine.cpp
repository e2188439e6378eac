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
#include "coverage_engine.hpp"
#include "loginfo.hpp"
#include "segmenter.hpp"
#include "workers.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

using ms = std::chrono::milliseconds;

namespace {
// Bumped whenever the layout or the meaning of a memoized artifact changes.
const uint64_t NETWORK_VERSION = 1;
const uint64_t TRACK_VERSION = 1;
const uint64_t COVERAGE_VERSION = 1;

const std::string NETWORK_KIND = "network";
const std::string TRACK_KIND = "track";
const std::string COVERAGE_KIND = "coverage";
}

CoverageEngine::CoverageEngine(Parameters parameters, Cache& cache)
    : parameters_(parameters)
    , cache(cache)
{
  parameters_.validate();
}

const Parameters& CoverageEngine::parameters() const { return parameters_; }

Fingerprint CoverageEngine::fingerprintNetwork(const std::vector<Way>& ways)
{
  FingerprintBuilder builder;
  builder.add(NETWORK_VERSION).add(ways.size());
  for (const auto& way : ways) {
    builder.add(way.id).add(static_cast<int>(way.type));
    builder.add(way.name.has_value()).add(way.name.value_or(""));
    builder.add(way.coordinates);
  }
  return builder.finish();
}

Fingerprint CoverageEngine::fingerprintTrack(const Track& track, double spacing)
{
  FingerprintBuilder builder;
  builder.add(TRACK_VERSION).add(track.source()).add(track.modified()).add(spacing);
  builder.add(track.points());
  return builder.finish();
}

Fingerprint CoverageEngine::fingerprintCoverage(
    Fingerprint network, std::vector<Fingerprint> tracks, const Parameters& parameters)
{
  // The set of tracks matters, not their order
  std::sort(tracks.begin(), tracks.end(),
      [](const auto& a, const auto& b) { return a.get() < b.get(); });

  FingerprintBuilder builder;
  builder.add(COVERAGE_VERSION).add(network).add(tracks.size());
  for (const auto& track : tracks) {
    builder.add(track);
  }
  builder.add(parameters.matchRadius)
      .add(parameters.trackSpacing)
      .add(parameters.segmentSpacing)
      .add(parameters.coverageThreshold)
      .add(parameters.effectiveCellSize());
  return builder.finish();
}

SegmentedNetwork CoverageEngine::segment(const std::vector<Way>& ways, Fingerprint key)
{
  return cache.getOrCompute<SegmentedNetwork>(NETWORK_KIND, key, [&]() {
    SegmentedNetwork network;
    network.segments = segmentNetwork(ways, network.diagnostics, parameters_.threads);
    return network;
  });
}

std::vector<std::vector<Coordinate>> CoverageEngine::sampleTracks(
    const std::vector<const Track*>& tracks, const std::vector<Fingerprint>& keys)
{
  std::vector<std::vector<Coordinate>> samples(tracks.size());
  parallelFor(tracks.size(), parameters_.threads, [&](size_t i) {
    samples[i] = cache.getOrCompute<std::vector<Coordinate>>(TRACK_KIND, keys[i],
        [&]() { return sampleTrack(*tracks[i], parameters_.trackSpacing); });
  });
  return samples;
}

CoverageReport CoverageEngine::run(const std::vector<Way>& ways, const std::vector<Track>& tracks)
{
  auto log = Logger::getInstance();
  auto start = std::chrono::high_resolution_clock::now();
  const size_t hitsBefore = cache.hits();
  const size_t missesBefore = cache.misses();
  const size_t corruptBefore = cache.corrupt();

  CoverageReport report;

  report.networkFingerprint = fingerprintNetwork(ways);
  auto network = segment(ways, report.networkFingerprint);
  report.segments = std::move(network.segments);
  report.diagnostics.merge(network.diagnostics);

  std::vector<const Track*> usable;
  std::vector<Fingerprint> trackKeys;
  for (const auto& track : tracks) {
    if (track.empty()) {
      ++report.diagnostics.skippedTracks;
      report.diagnostics.warn("skipping track " + track.source() + ": no points");
      continue;
    }
    usable.push_back(&track);
    trackKeys.push_back(fingerprintTrack(track, parameters_.trackSpacing));
  }
  report.usedTracks = usable.size();

  report.coverageFingerprint
      = fingerprintCoverage(report.networkFingerprint, trackKeys, parameters_);

  report.coverage = cache.getOrCompute<CoverageResult>(
      COVERAGE_KIND, report.coverageFingerprint, [&]() {
        auto perTrack = sampleTracks(usable, trackKeys);
        std::vector<Coordinate> samples;
        for (auto& trackSamples : perTrack) {
          std::move(trackSamples.begin(), trackSamples.end(), std::back_inserter(samples));
        }
        report.trackSamples = samples.size();

        auto indexStart = std::chrono::high_resolution_clock::now();
        Grid grid{ samples, parameters_.effectiveCellSize() };
        auto indexEnd = std::chrono::high_resolution_clock::now();
        std::cout << "..."
                  << "indexed " << grid.pointCount() << " track samples in " << grid.cellCount()
                  << " cells in " << std::chrono::duration_cast<ms>(indexEnd - indexStart).count()
                  << "ms" << '\n';

        return classify(report.segments, grid, parameters_);
      });
  applyCoverage(report.segments, report.coverage);

  report.diagnostics.cacheHits = cache.hits() - hitsBefore;
  report.diagnostics.cacheMisses = cache.misses() - missesBefore;
  report.diagnostics.cacheCorrupt = cache.corrupt() - corruptBefore;

  auto end = std::chrono::high_resolution_clock::now();
  const auto& coverage = report.coverage;
  const double totalKm = coverage.totalLength() / 1000.0;
  const double coveredKm = coverage.coveredLength() / 1000.0;

  std::ostringstream summary;
  summary << "covered " << coverage.coveredCount() << "/" << coverage.size() << " segments, "
          << std::fixed << std::setprecision(1) << coveredKm << "/" << totalKm << " km ("
          << std::setprecision(0) << (totalKm > 0 ? coveredKm / totalKm * 100.0 : 0.0) << "%)";
  std::cout << "..." << summary.str() << " in "
            << std::chrono::duration_cast<ms>(end - start).count() << "ms" << '\n';

  *log << summary.str() << ", tracks: " << report.usedTracks << ", skipped ways: "
       << report.diagnostics.skippedWays << ", skipped tracks: "
       << report.diagnostics.skippedTracks << ", cache hits: " << report.diagnostics.cacheHits
       << "\n";
  return report;
}
