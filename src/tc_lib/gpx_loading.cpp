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
#include "gpx_loading.hpp"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>

using ms = std::chrono::milliseconds;
namespace fs = boost::filesystem;
namespace pt = boost::property_tree;

std::vector<Track> parseGpx(std::istream& in, const std::string& source, int64_t modified)
{
  pt::ptree tree;
  pt::read_xml(in, tree, pt::xml_parser::trim_whitespace);

  std::vector<Track> tracks;
  const auto gpx = tree.get_child_optional("gpx");
  if (!gpx) {
    throw std::runtime_error(source + " is not a GPX document");
  }

  size_t trkCount = 0;
  for (const auto& trk : *gpx) {
    if (trk.first != "trk")
      continue;
    size_t segCount = 0;
    for (const auto& seg : trk.second) {
      if (seg.first != "trkseg")
        continue;
      std::vector<Coordinate> points;
      for (const auto& point : seg.second) {
        if (point.first != "trkpt")
          continue;
        auto lat = point.second.get<double>("<xmlattr>.lat");
        auto lng = point.second.get<double>("<xmlattr>.lon");
        points.emplace_back(Lat{ lat }, Lng{ lng });
      }
      tracks.emplace_back(source + "#" + std::to_string(trkCount) + "/" + std::to_string(segCount),
          std::move(points), modified);
      ++segCount;
    }
    ++trkCount;
  }
  return tracks;
}

std::vector<Track> loadTracksFromDirectory(
    const std::string& directory, const std::optional<BoundingBox>& region)
{
  fs::path dir{ directory };
  if (!fs::is_directory(dir)) {
    throw std::runtime_error("Activity directory " + directory + " does not exist");
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (fs::is_regular_file(entry.path()) && entry.path().extension() == ".gpx") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end(),
      [](const auto& a, const auto& b) { return a.filename() < b.filename(); });

  auto start = std::chrono::high_resolution_clock::now();
  std::vector<Track> tracks;
  size_t outside = 0;
  size_t failed = 0;
  for (const auto& file : files) {
    fs::ifstream in{ file };
    std::vector<Track> parsed;
    try {
      parsed = parseGpx(in, file.filename().string(), fs::last_write_time(file));
    } catch (const std::exception& e) {
      std::cerr << "Warning: failed to parse " << file.string() << ": " << e.what() << '\n';
      ++failed;
      continue;
    }

    for (auto& track : parsed) {
      if (region && !track.touches(*region)) {
        ++outside;
        continue;
      }
      tracks.push_back(std::move(track));
    }
  }
  auto end = std::chrono::high_resolution_clock::now();

  std::cout << "..."
            << "loaded " << tracks.size() << " tracks from " << files.size() - failed
            << " files in " << directory << " (" << outside << " outside of the region, "
            << failed << " unreadable) in " << std::chrono::duration_cast<ms>(end - start).count()
            << "ms" << '\n';
  return tracks;
}
