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
#ifndef COVERAGE_ENGINE_H
#define COVERAGE_ENGINE_H

#include "cache.hpp"
#include "classifier.hpp"
#include "diagnostics.hpp"
#include "network.hpp"
#include "parameters.hpp"
#include "track.hpp"

#include <vector>

// Segmentation output as it is memoized, including what segmentation skipped.
struct SegmentedNetwork {
  std::vector<Segment> segments;
  Diagnostics diagnostics;

  private:
  friend class boost::serialization::access;
  template <class Archive> void serialize(Archive& ar, const unsigned int /*version*/)
  {
    ar& segments;
    ar& diagnostics;
  }
};

struct CoverageReport {
  std::vector<Segment> segments;
  CoverageResult coverage;
  Diagnostics diagnostics;
  // Samples of all usable tracks, 0 if the coverage came out of the cache
  size_t trackSamples = 0;
  size_t usedTracks = 0;
  Fingerprint networkFingerprint;
  Fingerprint coverageFingerprint;
};

/*
  Runs segmentation, track sampling, index construction and classification. Segmented networks,
  track samples and coverage results are memoized in the given cache.
*/
class CoverageEngine {
  public:
  CoverageEngine(Parameters parameters, Cache& cache);
  CoverageEngine(const CoverageEngine& other) = delete;
  CoverageEngine& operator=(const CoverageEngine& other) = delete;
  virtual ~CoverageEngine() noexcept = default;

  CoverageReport run(const std::vector<Way>& ways, const std::vector<Track>& tracks);

  const Parameters& parameters() const;

  static Fingerprint fingerprintNetwork(const std::vector<Way>& ways);
  static Fingerprint fingerprintTrack(const Track& track, double spacing);
  static Fingerprint fingerprintCoverage(
      Fingerprint network, std::vector<Fingerprint> tracks, const Parameters& parameters);

  private:
  SegmentedNetwork segment(const std::vector<Way>& ways, Fingerprint key);
  std::vector<std::vector<Coordinate>> sampleTracks(
      const std::vector<const Track*>& tracks, const std::vector<Fingerprint>& keys);

  Parameters parameters_;
  Cache& cache;
};

#endif /* COVERAGE_ENGINE_H */
