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
#ifndef CLASSIFIER_H
#define CLASSIFIER_H

#include "grid.hpp"
#include "network.hpp"
#include "parameters.hpp"

#include <boost/serialization/split_member.hpp>
#include <boost/serialization/vector.hpp>
#include <optional>
#include <unordered_map>
#include <vector>

struct SegmentCoverage {
  SegmentId id;
  CoverageState state = CoverageState::Unclassified;
  double fraction = 0;
  double length = 0;
  size_t samples = 0;
  size_t matched = 0;

  bool operator==(const SegmentCoverage& other) const
  {
    return id == other.id && state == other.state && fraction == other.fraction
        && length == other.length && samples == other.samples && matched == other.matched;
  }

  private:
  friend class boost::serialization::access;
  template <class Archive> void serialize(Archive& ar, const unsigned int /*version*/)
  {
    ar& id;
    ar& state;
    ar& fraction;
    ar& length;
    ar& samples;
    ar& matched;
  }
};

// One entry per segment, in the order of the classified segments.
class CoverageResult {
  public:
  CoverageResult() = default;
  explicit CoverageResult(std::vector<SegmentCoverage>&& entries);
  CoverageResult(const CoverageResult& other) = default;
  CoverageResult(CoverageResult&& other) noexcept = default;
  virtual ~CoverageResult() noexcept = default;
  CoverageResult& operator=(const CoverageResult& other) = default;
  CoverageResult& operator=(CoverageResult&& other) noexcept = default;

  const std::vector<SegmentCoverage>& entries() const;
  std::optional<SegmentCoverage> find(SegmentId id) const;
  size_t size() const;

  size_t coveredCount() const;
  // Meters
  double totalLength() const;
  double coveredLength() const;

  bool operator==(const CoverageResult& other) const;

  private:
  friend class boost::serialization::access;

  void index();

  std::vector<SegmentCoverage> entries_;
  std::unordered_map<SegmentId, size_t> positions;

  template <class Archive> void save(Archive& ar, const unsigned int /*version*/) const
  {
    ar& entries_;
  }

  template <class Archive> void load(Archive& ar, const unsigned int /*version*/)
  {
    ar& entries_;
    index();
  }
  BOOST_SERIALIZATION_SPLIT_MEMBER()
};

CoverageState classifyFraction(double fraction, double threshold);

SegmentCoverage classifySegment(
    const Segment& segment, const Grid& grid, const Parameters& parameters);

/*
  Samples every segment every parameters.segmentSpacing meters and counts the samples having a
  track point within parameters.matchRadius. A segment is covered iff the matched fraction
  reaches parameters.coverageThreshold. Pure, segments are classified on parallel workers.
*/
CoverageResult classify(
    const std::vector<Segment>& segments, const Grid& grid, const Parameters& parameters);

// Copies the classified states into the segments. Segments without entry become Unclassified.
void applyCoverage(std::vector<Segment>& segments, const CoverageResult& result);

#endif /* CLASSIFIER_H */
