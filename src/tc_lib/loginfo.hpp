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
#ifndef LOGINFO_H
#define LOGINFO_H

#include <sstream>
#include <string>

// Collects the textual log of one run or request on the calling thread.
class Logger {
  public:
  static Logger* getInstance();
  // Clears the calling thread's log and returns it.
  static Logger* initLogger();

  void init();

  template <typename T> Logger& operator<<(const T& value)
  {
    std::ostringstream ss;
    ss << value;
    append(ss.str());
    return *this;
  }

  void append(const std::string& text);

  // Without leading and trailing whitespace
  std::string& getInfo();

  virtual ~Logger() noexcept = default;

  private:
  Logger() = default;

  static thread_local Logger instance;
  std::string info;
};

#endif /* LOGINFO_H */
