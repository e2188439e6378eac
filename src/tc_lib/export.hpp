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
#ifndef EXPORT_H
#define EXPORT_H

#include "cell_overlay.hpp"
#include "coverage_engine.hpp"

#include "json/json.h"

#include <string>

double roundTo(double value, double unit);

Json::Value segmentsToJson(
    const std::vector<Segment>& segments, const CoverageResult& coverage,
    const CellOverlay& overlay);
Json::Value cellsToJson(const CellOverlay& overlay);
Json::Value summaryToJson(const CoverageReport& report, const CellOverlay& overlay);

/*
  The full document: bbox, overlay grid, segments, cells and the summary. With writeLogs the
  Logger contents of the calling thread are attached as "debug".
*/
Json::Value coverageToJson(
    const CoverageReport& report, const CellOverlay& overlay, bool writeLogs = false);

// Creates missing parent directories. Throws std::runtime_error if the file cannot be written.
void writeJsonFile(const std::string& path, const Json::Value& value);

#endif /* EXPORT_H */
