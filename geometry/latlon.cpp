#include "geometry/latlon.hpp"

#include "geometry/geometry_exceptions.hpp"

#include "base/math.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace ms
{
LatLon::LatLon(double lat, double lon) : m_lat(lat), m_lon(lon)
{
  if (!IsValidLat(lat))
    MYTHROW(OutOfRangeError, ("Latitude", lat, "is out of range [", kMinLat, ",", kMaxLat, "]"));
  if (!IsValidLon(lon))
    MYTHROW(OutOfRangeError, ("Longitude", lon, "is out of range [", kMinLon, ",", kMaxLon, "]"));
}

// static
bool LatLon::IsValidLat(double lat)
{
  return std::isfinite(lat) && base::Between(kMinLat, kMaxLat, lat);
}

// static
bool LatLon::IsValidLon(double lon)
{
  return std::isfinite(lon) && base::Between(kMinLon, kMaxLon, lon);
}

bool LatLon::operator==(LatLon const & rhs) const
{
  return m_lat == rhs.m_lat && m_lon == rhs.m_lon;
}

bool LatLon::EqualDxDy(LatLon const & p, double eps) const
{
  return (base::AlmostEqualAbs(m_lat, p.m_lat, eps) &&
          base::AlmostEqualAbs(m_lon, p.m_lon, eps));
}

LatLonAlt::LatLonAlt(double lat, double lon, double altitudeMeters)
  : LatLonAlt(LatLon(lat, lon), altitudeMeters)
{
}

LatLonAlt::LatLonAlt(LatLon const & latLon, double altitudeMeters)
  : m_latLon(latLon), m_altitude(altitudeMeters)
{
  if (!std::isfinite(altitudeMeters))
    MYTHROW(OutOfRangeError, ("Altitude", altitudeMeters, "is not finite"));
}

bool LatLonAlt::operator==(LatLonAlt const & rhs) const
{
  return m_latLon == rhs.m_latLon && m_altitude == rhs.m_altitude;
}

std::string DebugPrint(LatLon const & t)
{
  std::ostringstream out;
  out << std::setprecision(20);
  out << "ms::LatLon(" << t.GetLat() << ", " << t.GetLon() << ")";
  return out.str();
}

std::string DebugPrint(LatLonAlt const & t)
{
  std::ostringstream out;
  out << std::setprecision(20);
  out << "ms::LatLonAlt(" << t.GetLatLon().GetLat() << ", " << t.GetLatLon().GetLon() << ", "
      << t.GetAltitude() << ")";
  return out.str();
}
}  // namespace ms
