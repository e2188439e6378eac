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
#ifndef SEGMENTER_H
#define SEGMENTER_H

#include "diagnostics.hpp"
#include "network.hpp"

#include <unordered_set>
#include <vector>

using SplitPoints = std::unordered_set<CoordinateKey, CoordinateKeyHash>;

/*
  Nodes referenced by two or more distinct ways or repeated inside a single way. Ways are
  expected without consecutive duplicates.
*/
SplitPoints findSplitPoints(const std::vector<const Way*>& ways);

// Removes consecutive coordinates that quantize to the same node.
std::vector<Coordinate> collapseRepeatedNodes(const std::vector<Coordinate>& coordinates);

// Splits one cleaned way at every interior split point. Ordinals count from 0.
std::vector<Segment> splitWay(const Way& way, const SplitPoints& splitPoints);

/*
  Decomposes the network into atomic segments. Ways with fewer than two distinct coordinates and
  ways repeating an already seen id are skipped and counted in `diagnostics`. The result is
  ordered by way, then ordinal.
*/
std::vector<Segment> segmentNetwork(
    const std::vector<Way>& ways, Diagnostics& diagnostics, size_t threads = 0);

#endif /* SEGMENTER_H */
