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
#include "diagnostics.hpp"
#include "loginfo.hpp"

#include <iostream>

void Diagnostics::warn(const std::string& message)
{
  std::cerr << "Warning: " << message << '\n';
  *Logger::getInstance() << "warning: " << message << "\n";
  warnings.push_back(message);
}

void Diagnostics::merge(const Diagnostics& other)
{
  skippedWays += other.skippedWays;
  skippedTracks += other.skippedTracks;
  cacheHits += other.cacheHits;
  cacheMisses += other.cacheMisses;
  cacheCorrupt += other.cacheCorrupt;
  warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
}
