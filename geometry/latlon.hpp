#pragma once

#include <string>

namespace ms
{
/// \brief Validated geographic point in degrees.
/// \note Every LatLon that exists satisfies kMinLat <= lat <= kMaxLat and
/// kMinLon <= lon <= kMaxLon, so consumers never check the bounds again.
class LatLon
{
public:
  static double constexpr kMinLat = -90.0;
  static double constexpr kMaxLat = 90.0;
  static double constexpr kMinLon = -180.0;
  static double constexpr kMaxLon = 180.0;

  /// Throws OutOfRangeError if |lat| or |lon| is out of range or is not finite.
  LatLon(double lat, double lon);

  static bool IsValidLat(double lat);
  static bool IsValidLon(double lon);
  static bool IsValid(double lat, double lon) { return IsValidLat(lat) && IsValidLon(lon); }

  double GetLat() const { return m_lat; }
  double GetLon() const { return m_lon; }

  bool operator==(LatLon const & rhs) const;
  bool operator!=(LatLon const & rhs) const { return !(*this == rhs); }

  bool EqualDxDy(LatLon const & p, double eps) const;

private:
  double m_lat;
  double m_lon;
};

/// \brief LatLon with an altitude in meters above the reference surface.
class LatLonAlt
{
public:
  /// Throws OutOfRangeError if a coordinate is out of range or |altitudeMeters| is not finite.
  LatLonAlt(double lat, double lon, double altitudeMeters);
  LatLonAlt(LatLon const & latLon, double altitudeMeters);

  LatLon const & GetLatLon() const { return m_latLon; }
  double GetAltitude() const { return m_altitude; }

  bool operator==(LatLonAlt const & rhs) const;
  bool operator!=(LatLonAlt const & rhs) const { return !(*this == rhs); }

private:
  LatLon m_latLon;
  double m_altitude;
};

std::string DebugPrint(LatLon const & t);
std::string DebugPrint(LatLonAlt const & t);
}  // namespace ms
