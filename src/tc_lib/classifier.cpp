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
#include "classifier.hpp"
#include "workers.hpp"

#include <algorithm>
#include <numeric>

CoverageResult::CoverageResult(std::vector<SegmentCoverage>&& entries)
    : entries_(std::move(entries))
{
  index();
}

void CoverageResult::index()
{
  positions.clear();
  positions.reserve(entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    positions.insert({ entries_[i].id, i });
  }
}

const std::vector<SegmentCoverage>& CoverageResult::entries() const { return entries_; }

std::optional<SegmentCoverage> CoverageResult::find(SegmentId id) const
{
  auto it = positions.find(id);
  if (it == positions.end()) {
    return {};
  }
  return entries_[it->second];
}

size_t CoverageResult::size() const { return entries_.size(); }

size_t CoverageResult::coveredCount() const
{
  return std::count_if(entries_.begin(), entries_.end(),
      [](const auto& e) { return e.state == CoverageState::Covered; });
}

double CoverageResult::totalLength() const
{
  return std::accumulate(entries_.begin(), entries_.end(), 0.0,
      [](double sum, const auto& e) { return sum + e.length; });
}

double CoverageResult::coveredLength() const
{
  return std::accumulate(entries_.begin(), entries_.end(), 0.0, [](double sum, const auto& e) {
    return e.state == CoverageState::Covered ? sum + e.length : sum;
  });
}

bool CoverageResult::operator==(const CoverageResult& other) const
{
  return entries_ == other.entries_;
}

CoverageState classifyFraction(double fraction, double threshold)
{
  return fraction >= threshold ? CoverageState::Covered : CoverageState::Uncovered;
}

SegmentCoverage classifySegment(
    const Segment& segment, const Grid& grid, const Parameters& parameters)
{
  SegmentCoverage coverage;
  coverage.id = segment.id();
  coverage.length = segment.length();

  const auto samples = sampleSegment(segment, parameters.segmentSpacing);
  coverage.samples = samples.size();
  coverage.matched = std::count_if(samples.begin(), samples.end(), [&](const SamplePoint& p) {
    return grid.hasPointWithin(p.coordinate, parameters.matchRadius);
  });

  if (coverage.samples == 0) {
    coverage.state = CoverageState::Uncovered;
    return coverage;
  }
  coverage.fraction = static_cast<double>(coverage.matched) / coverage.samples;
  coverage.state = classifyFraction(coverage.fraction, parameters.coverageThreshold);
  return coverage;
}

CoverageResult classify(
    const std::vector<Segment>& segments, const Grid& grid, const Parameters& parameters)
{
  std::vector<SegmentCoverage> entries(segments.size());
  parallelFor(segments.size(), parameters.threads,
      [&](size_t i) { entries[i] = classifySegment(segments[i], grid, parameters); });
  return CoverageResult{ std::move(entries) };
}

void applyCoverage(std::vector<Segment>& segments, const CoverageResult& result)
{
  for (auto& segment : segments) {
    auto coverage = result.find(segment.id());
    segment.state(coverage ? coverage->state : CoverageState::Unclassified);
  }
}
