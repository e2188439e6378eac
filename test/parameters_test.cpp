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
#include <catch2/catch.hpp>
#include "parameters.hpp"

#include <stdexcept>

TEST_CASE("Parameter validation names the offending value")
{
  REQUIRE_NOTHROW(Parameters{}.validate());
  REQUIRE(Parameters{}.effectiveCellSize() == 10.0);

  Parameters parameters;
  parameters.trackSpacing = -2;
  REQUIRE_THROWS_WITH(parameters.validate(), Catch::Contains("track sample spacing"));

  parameters = Parameters{};
  parameters.coverageThreshold = -0.1;
  REQUIRE_THROWS_AS(parameters.validate(), std::invalid_argument);

  parameters = Parameters{};
  parameters.cellSize = 25;
  REQUIRE(parameters.effectiveCellSize() == 25.0);
}
