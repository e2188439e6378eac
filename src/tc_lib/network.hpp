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
#ifndef NETWORK_H
#define NETWORK_H

#include "geometry.hpp"
#include "serialize_optional.hpp"

#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

enum class TrailType : uint8_t {
  Path,
  Track,
  Footway,
  Other
};

// Maps an OSM highway tag value to a trail type. Unknown values become TrailType::Other.
TrailType trailTypeFromTag(const std::string& highway);
std::string trailTypeName(TrailType type);

struct Way {
  int64_t id = 0;
  TrailType type = TrailType::Other;
  std::optional<std::string> name;
  std::vector<Coordinate> coordinates;
};

struct SegmentId {
  int64_t way = 0;
  uint32_t ordinal = 0;

  SegmentId() = default;
  SegmentId(int64_t way, uint32_t ordinal)
      : way(way)
      , ordinal(ordinal)
  {
  }

  bool operator==(const SegmentId& other) const
  {
    return way == other.way && ordinal == other.ordinal;
  }
  bool operator!=(const SegmentId& other) const { return !(*this == other); }
  bool operator<(const SegmentId& other) const
  {
    return way < other.way || (way == other.way && ordinal < other.ordinal);
  }

  private:
  friend class boost::serialization::access;
  template <class Archive> void serialize(Archive& ar, const unsigned int /*version*/)
  {
    ar& way;
    ar& ordinal;
  }
};

std::ostream& operator<<(std::ostream& os, const SegmentId& id);
std::string to_string(const SegmentId& id);

namespace std {
template <> struct hash<SegmentId> {
  size_t operator()(const SegmentId& id) const;
};
}

enum class CoverageState : uint8_t {
  Unclassified,
  Covered,
  Uncovered
};

std::string coverageStateName(CoverageState state);

/*
  An intersection free piece of a way. Nodes shared with other ways only ever appear as the
  first or the last coordinate. Segments are created by segmentNetwork and never merged again.
*/
class Segment {
  public:
  Segment() = default;
  Segment(SegmentId id, TrailType type, std::optional<std::string> name,
      std::vector<Coordinate>&& coordinates);
  Segment(const Segment& other) = default;
  Segment(Segment&& other) noexcept = default;
  virtual ~Segment() noexcept = default;
  Segment& operator=(const Segment& other) = default;
  Segment& operator=(Segment&& other) noexcept = default;

  SegmentId id() const;
  TrailType type() const;
  const std::optional<std::string>& name() const;
  const std::vector<Coordinate>& coordinates() const;
  double length() const;

  CoverageState state() const;
  void state(CoverageState state);

  bool operator==(const Segment& other) const;

  private:
  friend class boost::serialization::access;

  SegmentId id_;
  TrailType type_ = TrailType::Other;
  std::optional<std::string> name_;
  std::vector<Coordinate> coordinates_;
  CoverageState state_ = CoverageState::Unclassified;

  template <class Archive> void serialize(Archive& ar, const unsigned int /*version*/)
  {
    ar& id_;
    ar& type_;
    ar& name_;
    ar& coordinates_;
    ar& state_;
  }
};

struct SamplePoint {
  Coordinate coordinate;
  const Segment* segment;
};

std::vector<SamplePoint> sampleSegment(const Segment& segment, double spacing);

#endif /* NETWORK_H */
