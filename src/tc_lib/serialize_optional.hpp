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
#ifndef SERIALIZE_OPTIONAL_H
#define SERIALIZE_OPTIONAL_H

#include <boost/serialization/split_free.hpp>
#include <optional>

// Boost 1.74 only knows boost::optional. Segment names are std::optional<std::string>.
namespace boost {
namespace serialization {

  template <class Archive, class T>
  void save(Archive& ar, const std::optional<T>& value, const unsigned int /*version*/)
  {
    const bool present = value.has_value();
    ar << present;
    if (present) {
      ar << *value;
    }
  }

  template <class Archive, class T>
  void load(Archive& ar, std::optional<T>& value, const unsigned int /*version*/)
  {
    bool present = false;
    ar >> present;
    if (!present) {
      value.reset();
      return;
    }
    T loaded{};
    ar >> loaded;
    value = std::move(loaded);
  }

  template <class Archive, class T>
  void serialize(Archive& ar, std::optional<T>& value, const unsigned int version)
  {
    boost::serialization::split_free(ar, value, version);
  }
}
}

#endif /* SERIALIZE_OPTIONAL_H */
