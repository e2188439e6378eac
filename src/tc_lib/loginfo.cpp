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
#include "loginfo.hpp"

#include <boost/algorithm/string/trim.hpp>

thread_local Logger Logger::instance;

Logger* Logger::getInstance() { return &instance; }

Logger* Logger::initLogger()
{
  auto log = getInstance();
  log->init();
  return log;
}

void Logger::init() { info.clear(); }

void Logger::append(const std::string& text) { info += text; }

std::string& Logger::getInfo()
{
  boost::algorithm::trim(info);
  return info;
}
