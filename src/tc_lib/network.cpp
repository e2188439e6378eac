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
#include "network.hpp"

#include <boost/container_hash/hash.hpp>
#include <sstream>
#include <stdexcept>

TrailType trailTypeFromTag(const std::string& highway)
{
  if (highway == "path") {
    return TrailType::Path;
  }
  if (highway == "track") {
    return TrailType::Track;
  }
  if (highway == "footway") {
    return TrailType::Footway;
  }
  return TrailType::Other;
}

std::string trailTypeName(TrailType type)
{
  switch (type) {
  case TrailType::Path:
    return "path";
  case TrailType::Track:
    return "track";
  case TrailType::Footway:
    return "footway";
  case TrailType::Other:
    break;
  }
  return "other";
}

std::ostream& operator<<(std::ostream& os, const SegmentId& id)
{
  os << id.way << "/" << id.ordinal;
  return os;
}

std::string to_string(const SegmentId& id)
{
  std::ostringstream ss;
  ss << id;
  return ss.str();
}

size_t std::hash<SegmentId>::operator()(const SegmentId& id) const
{
  size_t seed = 0;
  boost::hash_combine(seed, id.way);
  boost::hash_combine(seed, id.ordinal);
  return seed;
}

std::string coverageStateName(CoverageState state)
{
  switch (state) {
  case CoverageState::Covered:
    return "covered";
  case CoverageState::Uncovered:
    return "uncovered";
  case CoverageState::Unclassified:
    break;
  }
  return "unclassified";
}

Segment::Segment(SegmentId id, TrailType type, std::optional<std::string> name,
    std::vector<Coordinate>&& coordinates)
    : id_(id)
    , type_(type)
    , name_(std::move(name))
    , coordinates_(std::move(coordinates))
{
  if (coordinates_.size() < 2) {
    throw std::invalid_argument("Segment " + to_string(id) + " needs at least two coordinates");
  }
}

SegmentId Segment::id() const { return id_; }
TrailType Segment::type() const { return type_; }
const std::optional<std::string>& Segment::name() const { return name_; }
const std::vector<Coordinate>& Segment::coordinates() const { return coordinates_; }
double Segment::length() const { return pathLength(coordinates_); }

CoverageState Segment::state() const { return state_; }
void Segment::state(CoverageState state) { state_ = state; }

bool Segment::operator==(const Segment& other) const
{
  return id_ == other.id_ && type_ == other.type_ && name_ == other.name_
      && coordinates_ == other.coordinates_ && state_ == other.state_;
}

std::vector<SamplePoint> sampleSegment(const Segment& segment, double spacing)
{
  auto coordinates = interpolate(segment.coordinates(), spacing);
  std::vector<SamplePoint> samples;
  samples.reserve(coordinates.size());
  for (const auto& c : coordinates) {
    samples.push_back(SamplePoint{ c, &segment });
  }
  return samples;
}
