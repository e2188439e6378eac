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
#include "cell_overlay.hpp"
#include "coverage_engine.hpp"
#include "export.hpp"
#include "gpx_loading.hpp"
#include "loginfo.hpp"
#include "option_parsing.hpp"
#include "overpass_loading.hpp"

#include "server_http.hpp"
#include "json/json.h"

#include <algorithm>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <thread>

namespace po = boost::program_options;

void runWebServer(const Json::Value& document, const std::string& webRoot, unsigned short port)
{
  using HttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;
  using Response = std::shared_ptr<HttpServer::Response>;
  using Request = std::shared_ptr<HttpServer::Request>;

  Json::StreamWriterBuilder builder;
  const std::string coverage = Json::writeString(builder, document);
  const std::string stats = Json::writeString(builder, document["summary"]);

  HttpServer server;
  server.config.port = port;
  server.config.thread_pool_size
      = std::thread::hardware_concurrency() > 0 ? std::thread::hardware_concurrency() : 1;

  server.default_resource["GET"] = [](Response response, Request /*request*/) {
    SimpleWeb::CaseInsensitiveMultimap header;
    header.emplace("Location", "/web");
    response->write(
        SimpleWeb::StatusCode::redirection_temporary_redirect, "No matching handler found", header);
  };

  server.resource["^/coverage$"]["GET"] = [&coverage](Response response, Request /*request*/) {
    SimpleWeb::CaseInsensitiveMultimap header;
    header.emplace("Content-Type", "application/json");
    response->write(SimpleWeb::StatusCode::success_ok, coverage, header);
  };

  server.resource["^/stats$"]["GET"] = [&stats](Response response, Request /*request*/) {
    SimpleWeb::CaseInsensitiveMultimap header;
    header.emplace("Content-Type", "application/json");
    response->write(SimpleWeb::StatusCode::success_ok, stats, header);
  };

  server.resource["^/web/?.*"]["GET"] = [&webRoot](Response response, Request request) {
    try {
      auto web_root_path = boost::filesystem::canonical(webRoot);

      std::string pathWithoutWeb{};
      if (request->path.length() > 4) {
        pathWithoutWeb = request->path.substr(4);
      }

      auto path = boost::filesystem::canonical(web_root_path / pathWithoutWeb);
      // Check if path is within web_root_path
      if (std::distance(web_root_path.begin(), web_root_path.end())
              > std::distance(path.begin(), path.end())
          || !std::equal(web_root_path.begin(), web_root_path.end(), path.begin())) {
        response->write(SimpleWeb::StatusCode::client_error_forbidden,
            "path must be within root path");
        return;
      }
      if (boost::filesystem::is_directory(path)) {
        path /= "index.html";
      }

      std::ifstream ifs{};
      ifs.open(path.string(), std::ifstream::in | std::ios::binary | std::ios::ate);
      if (!ifs) {
        response->write(SimpleWeb::StatusCode::client_error_not_found, "No such file");
        return;
      }
      auto length = ifs.tellg();
      ifs.seekg(0, std::ios::beg);

      std::string buffer(length, '\0');
      ifs.read(&buffer[0], length);
      response->write(buffer);
    } catch (const boost::filesystem::filesystem_error& e) {
      response->write(SimpleWeb::StatusCode::client_error_not_found, e.what());
    }
  };

  std::cout << "Starting web server at http://localhost:" << server.config.port << '\n';
  server.start();
}

int run(po::variables_map& vm, Parameters parameters)
{
  const auto& networkFile = vm["network"].as<std::string>();
  const auto& activityDir = vm["activities"].as<std::string>();

  std::optional<BoundingBox> region;
  if (vm.count("bbox") > 0) {
    region = parseBoundingBox(vm["bbox"].as<std::string>());
  }
  auto types = DEFAULT_TRAIL_TYPES;
  if (vm.count("types") > 0) {
    types = parseTrailTypes(vm["types"].as<std::string>());
  }
  const double gridSize = vm["grid-size"].as<double>();
  if (!(gridSize > 0)) {
    throw std::invalid_argument("--grid-size has to be positive");
  }
  parameters.validate();

  auto log = Logger::initLogger();
  const bool zipped_input = vm.count("zi") > 0;
  auto ways = loadWaysFromOverpassFile(networkFile, zipped_input, types);
  auto tracks = loadTracksFromDirectory(activityDir, region);
  *log << "loaded " << ways.size() << " ways and " << tracks.size() << " tracks\n";

  Cache cache{ std::make_shared<FileCacheStore>(vm["cache-dir"].as<std::string>()) };
  if (vm.count("no-cache") > 0) {
    cache.invalidate();
  }

  CoverageEngine engine{ parameters, cache };
  auto report = engine.run(ways, tracks);

  const auto overlayRegion = region ? *region : networkBoundingBox(report.segments);
  CellOverlay overlay{ report.segments, report.coverage, gridSize, overlayRegion };
  auto document = coverageToJson(report, overlay, true);

  if (vm.count("output") > 0) {
    writeJsonFile(vm["output"].as<std::string>(), document);
  }

  if (vm.count("web") > 0) {
    runWebServer(document, vm["web-root"].as<std::string>(), vm["port"].as<unsigned short>());
  }
  return 0;
}

int main(int argc, char* argv[])
{
  Parameters parameters{};
  std::string configFile{};

  po::options_description loading{ "loading options" };
  loading.add_options()("network,n", po::value<std::string>(),
      "load trail network from Overpass JSON file")("zi", "network file is gzipped")(
      "activities,a", po::value<std::string>(), "directory containing GPX activities")(
      "bbox", po::value<std::string>(), "only use tracks touching south,west,north,east")("types",
      po::value<std::string>(), "comma separated trail types to load (default path,track,footway)");

  po::options_description coverage{ "coverage options" };
  coverage.add_options()("match-radius", po::value<double>(&parameters.matchRadius),
      "max distance in meters between a trail sample and a track point");
  coverage.add_options()("track-spacing", po::value<double>(&parameters.trackSpacing),
      "track sample spacing in meters");
  coverage.add_options()("segment-spacing", po::value<double>(&parameters.segmentSpacing),
      "segment sample spacing in meters");
  coverage.add_options()("threshold", po::value<double>(&parameters.coverageThreshold),
      "matched fraction from which a segment counts as covered");
  coverage.add_options()("cell-size", po::value<double>(&parameters.cellSize),
      "index cell size in meters, 0 uses the match radius");
  coverage.add_options()(
      "threads", po::value<size_t>(&parameters.threads), "worker threads, 0 uses all cores");

  po::options_description caching{ "cache options" };
  caching.add_options()("cache-dir", po::value<std::string>()->default_value("cache"),
      "directory for memoized artifacts");
  caching.add_options()("no-cache", "clear the cache before running");

  po::options_description action{ "actions" };
  action.add_options()("output,o", po::value<std::string>(), "write coverage JSON to file");
  action.add_options()("grid-size", po::value<double>()->default_value(DEFAULT_OVERLAY_CELL_SIZE),
      "overlay cell size in meters");
  action.add_options()("web,w", "start webserver for interaction via browser");

  po::options_description web{ "web options" };
  web.add_options()(
      "port", po::value<unsigned short>()->default_value(8080), "port to listen on");
  web.add_options()(
      "web-root", po::value<std::string>()->default_value("web"), "directory served below /web");

  po::options_description fileOptions;
  fileOptions.add(loading).add(coverage).add(caching).add(action).add(web);

  po::options_description all;
  all.add_options()("help,h", "prints help message")(
      "config", po::value<std::string>(&configFile), "read options from an ini file");
  all.add(fileOptions);

  po::variables_map vm{};
  try {
    po::store(po::parse_command_line(argc, argv, all), vm);
    if (vm.count("config") > 0) {
      std::ifstream config{ vm["config"].as<std::string>() };
      if (!config) {
        std::cerr << "Could not open config file " << vm["config"].as<std::string>() << '\n';
        return 2;
      }
      po::store(po::parse_config_file(config, fileOptions), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    std::cerr << "Maybe try --help" << '\n';
    return 2;
  }

  if (vm.count("help") > 0) {
    std::cout << all << '\n';
    return 0;
  }
  if (vm.count("network") == 0 || vm.count("activities") == 0) {
    std::cerr << "No trail network or activity directory given" << '\n';
    std::cerr << "Maybe try --help" << '\n';
    return 2;
  }

  try {
    return run(vm, parameters);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Invalid option: " << e.what() << '\n';
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
