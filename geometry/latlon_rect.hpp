#pragma once

#include "geometry/latlon.hpp"

#include <string>
#include <vector>

namespace ms
{
/// \brief Axis-aligned box in latitude/longitude degrees.
/// \note The box does not wrap around the antimeridian: minLon <= maxLon always.
class LatLonRect
{
public:
  /// Throws ValidationError if a bound is out of range or min > max.
  LatLonRect(double minLat, double maxLat, double minLon, double maxLon);

  /// Tightest box around |points|. Throws EmptyInputError if |points| is empty.
  static LatLonRect FromPoints(std::vector<LatLon> const & points);

  double GetMinLat() const { return m_minLat; }
  double GetMaxLat() const { return m_maxLat; }
  double GetMinLon() const { return m_minLon; }
  double GetMaxLon() const { return m_maxLon; }

  bool Contains(LatLon const & ll) const;

  /// Box grown by |slackDeg| in every direction and clamped to the valid coordinate range.
  /// Throws ValidationError if |slackDeg| is negative or is not finite.
  LatLonRect Expanded(double slackDeg) const;

  bool operator==(LatLonRect const & rhs) const;
  bool operator!=(LatLonRect const & rhs) const { return !(*this == rhs); }

private:
  double m_minLat;
  double m_maxLat;
  double m_minLon;
  double m_maxLon;
};

std::string DebugPrint(LatLonRect const & rect);
}  // namespace ms
