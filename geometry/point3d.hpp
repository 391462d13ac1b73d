#pragma once

#include <cmath>
#include <sstream>
#include <string>

namespace m3
{
template <typename T>
class Point
{
public:
  constexpr Point() : x(T()), y(T()), z(T()) {}
  constexpr Point(T x_, T y_, T z_) : x(x_), y(y_), z(z_) {}

  T Length() const { return std::sqrt(x * x + y * y + z * z); }

  T x;
  T y;
  T z;
};

template <typename T>
T Distance(Point<T> const & a, Point<T> const & b)
{
  return Point<T>(a.x - b.x, a.y - b.y, a.z - b.z).Length();
}

using PointD = Point<double>;

template <typename T>
std::string DebugPrint(Point<T> const & p)
{
  std::ostringstream out;
  out.precision(20);
  out << "m3::Point(" << p.x << ", " << p.y << ", " << p.z << ")";
  return out.str();
}
}  // namespace m3
