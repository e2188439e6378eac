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
#include "overpass_loading.hpp"

#include "json/json.h"

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

using ms = std::chrono::milliseconds;
namespace iostr = boost::iostreams;

namespace {

std::optional<Coordinate> coordinateFrom(const Json::Value& value)
{
  if (!value.isObject() || !value["lat"].isNumeric() || !value["lon"].isNumeric()) {
    return {};
  }
  return Coordinate{ Lat{ value["lat"].asDouble() }, Lng{ value["lon"].asDouble() } };
}

Way wayFrom(const Json::Value& element,
    const std::unordered_map<Json::Int64, Coordinate>& nodes)
{
  Way way;
  way.id = element["id"].asInt64();

  const auto& tags = element["tags"];
  if (tags.isObject()) {
    if (tags["highway"].isString()) {
      way.type = trailTypeFromTag(tags["highway"].asString());
    }
    if (tags["name"].isString()) {
      way.name = tags["name"].asString();
    }
  }

  if (element["geometry"].isArray()) {
    for (const auto& point : element["geometry"]) {
      // Overpass writes null for nodes outside of the queried area
      if (auto c = coordinateFrom(point)) {
        way.coordinates.push_back(*c);
      }
    }
  } else if (element["nodes"].isArray()) {
    for (const auto& id : element["nodes"]) {
      auto node = nodes.find(id.asInt64());
      if (node != nodes.end()) {
        way.coordinates.push_back(node->second);
      }
    }
  }
  return way;
}
}

std::vector<Way> parseOverpassJson(std::istream& in, const std::set<TrailType>& types)
{
  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errors;
  if (!Json::parseFromStream(builder, in, &root, &errors)) {
    throw std::runtime_error("Failed to parse Overpass JSON: " + errors);
  }
  if (!root.isObject() || !root["elements"].isArray()) {
    throw std::runtime_error("Overpass JSON has no elements array");
  }

  const auto& elements = root["elements"];
  std::unordered_map<Json::Int64, Coordinate> nodes;
  for (const auto& element : elements) {
    if (element["type"].asString() == "node") {
      if (auto c = coordinateFrom(element)) {
        nodes.insert({ element["id"].asInt64(), *c });
      }
    }
  }

  std::vector<Way> ways;
  size_t filtered = 0;
  for (const auto& element : elements) {
    if (element["type"].asString() != "way" || !element["id"].isIntegral()) {
      continue;
    }
    auto way = wayFrom(element, nodes);
    if (types.find(way.type) == types.end()) {
      ++filtered;
      continue;
    }
    ways.push_back(std::move(way));
  }

  std::cout << "..."
            << "parsed " << ways.size() << " ways from " << nodes.size() << " nodes, dropped "
            << filtered << " ways of other types" << '\n';
  return ways;
}

std::vector<Way> loadWaysFromOverpassFile(
    const std::string& path, bool zipped, const std::set<TrailType>& types)
{
  std::ifstream file{ path, std::ios::binary };
  if (!file) {
    throw std::runtime_error("Could not open trail network " + path);
  }

  iostr::filtering_istream in;
  if (zipped)
    in.push(iostr::gzip_decompressor());
  in.push(file);

  std::cout << "Reading trail network from " << path << '\n';
  auto start = std::chrono::high_resolution_clock::now();
  auto ways = parseOverpassJson(in, types);
  auto end = std::chrono::high_resolution_clock::now();

  std::cout << "loading the trail network took "
            << std::chrono::duration_cast<ms>(end - start).count() << "ms" << '\n';
  return ways;
}
