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
#ifndef GPX_LOADING_H
#define GPX_LOADING_H

#include "track.hpp"

#include <istream>
#include <optional>
#include <string>
#include <vector>

// One track per trkseg. Throws boost::property_tree::xml_parser_error on malformed XML.
std::vector<Track> parseGpx(std::istream& in, const std::string& source, int64_t modified = 0);

/*
  Loads all *.gpx files of a directory in file name order. Files that fail to parse are
  reported and skipped. With a region only tracks having a point inside of it are kept.
  Throws std::runtime_error if the directory does not exist.
*/
std::vector<Track> loadTracksFromDirectory(
    const std::string& directory, const std::optional<BoundingBox>& region = {});

#endif /* GPX_LOADING_H */
