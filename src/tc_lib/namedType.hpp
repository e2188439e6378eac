#ifndef NAMEDTYPE_H
#define NAMEDTYPE_H

#include <boost/serialization/access.hpp>
#include <functional>
#include <type_traits>

// Named Type idiom taken from
// https://www.fluentcpp.com/2017/03/06/passing-strong-types-reference-revisited/
template <typename T, typename Parameter>
class NamedType {
  public:
  using underlying_type = T;

  NamedType()
      : value_(T{})
  {
  }

  explicit NamedType(T const& value)
      : value_(value)
  {
  }

  template <typename T_ = T>
  explicit NamedType(T&& value,
      typename std::enable_if<!std::is_reference<T_>{}, std::nullptr_t>::type = nullptr)
      : value_(std::move(value))
  {
  }

  T& get() { return value_; }
  T const& get() const { return value_; }
  operator T() const { return value_; }

  private:
  friend class boost::serialization::access;
  template <class Archive> void serialize(Archive& ar, const unsigned int /*version*/)
  {
    ar& value_;
  }

  T value_;
};

namespace std {

template <typename T, typename Parameter> struct hash<NamedType<T, Parameter>> {
  size_t operator()(const NamedType<T, Parameter>& x) const { return std::hash<T>()(x.get()); }
};
}

#endif /* NAMEDTYPE_H */
