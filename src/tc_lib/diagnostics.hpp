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
#ifndef DIAGNOSTICS_H
#define DIAGNOSTICS_H

#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include <string>
#include <vector>

/*
  Counts of everything a run skipped or recovered from. Malformed ways and tracks are dropped
  and cache failures are recomputed, so these counts are the only trace they leave.
*/
struct Diagnostics {
  size_t skippedWays = 0;
  size_t skippedTracks = 0;
  size_t cacheHits = 0;
  size_t cacheMisses = 0;
  size_t cacheCorrupt = 0;
  std::vector<std::string> warnings;

  // Records a warning and prints it to std::cerr and the thread's Logger.
  void warn(const std::string& message);

  // Adds the counts and warnings of `other` without printing them again.
  void merge(const Diagnostics& other);

  private:
  friend class boost::serialization::access;
  template <class Archive> void serialize(Archive& ar, const unsigned int /*version*/)
  {
    ar& skippedWays;
    ar& skippedTracks;
    ar& warnings;
  }
};

#endif /* DIAGNOSTICS_H */
