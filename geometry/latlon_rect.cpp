#include "geometry/latlon_rect.hpp"

#include "geometry/geometry_exceptions.hpp"

#include "base/math.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ms
{
LatLonRect::LatLonRect(double minLat, double maxLat, double minLon, double maxLon)
  : m_minLat(minLat), m_maxLat(maxLat), m_minLon(minLon), m_maxLon(maxLon)
{
  if (!LatLon::IsValidLat(minLat) || !LatLon::IsValidLat(maxLat))
    MYTHROW(OutOfRangeError, ("Latitude bounds are out of range:", minLat, maxLat));
  if (!LatLon::IsValidLon(minLon) || !LatLon::IsValidLon(maxLon))
    MYTHROW(OutOfRangeError, ("Longitude bounds are out of range:", minLon, maxLon));
  if (minLat > maxLat || minLon > maxLon)
  {
    MYTHROW(ValidationError, ("Minimum exceeds maximum in bounding box:", minLat, maxLat, minLon,
                              maxLon));
  }
}

// static
LatLonRect LatLonRect::FromPoints(std::vector<LatLon> const & points)
{
  if (points.empty())
    MYTHROW(EmptyInputError, ("Can't build a bounding box of an empty point set"));

  double minLat = points.front().GetLat();
  double maxLat = minLat;
  double minLon = points.front().GetLon();
  double maxLon = minLon;
  for (auto const & p : points)
  {
    minLat = std::min(minLat, p.GetLat());
    maxLat = std::max(maxLat, p.GetLat());
    minLon = std::min(minLon, p.GetLon());
    maxLon = std::max(maxLon, p.GetLon());
  }
  return LatLonRect(minLat, maxLat, minLon, maxLon);
}

bool LatLonRect::Contains(LatLon const & ll) const
{
  return base::Between(m_minLat, m_maxLat, ll.GetLat()) &&
         base::Between(m_minLon, m_maxLon, ll.GetLon());
}

LatLonRect LatLonRect::Expanded(double slackDeg) const
{
  if (!std::isfinite(slackDeg) || slackDeg < 0.0)
    MYTHROW(ValidationError, ("Bounding box slack must be finite and non-negative:", slackDeg));

  return LatLonRect(std::max(LatLon::kMinLat, m_minLat - slackDeg),
                    std::min(LatLon::kMaxLat, m_maxLat + slackDeg),
                    std::max(LatLon::kMinLon, m_minLon - slackDeg),
                    std::min(LatLon::kMaxLon, m_maxLon + slackDeg));
}

bool LatLonRect::operator==(LatLonRect const & rhs) const
{
  return m_minLat == rhs.m_minLat && m_maxLat == rhs.m_maxLat && m_minLon == rhs.m_minLon &&
         m_maxLon == rhs.m_maxLon;
}

std::string DebugPrint(LatLonRect const & rect)
{
  std::ostringstream out;
  out << std::setprecision(20);
  out << "LatLonRect [ lat: " << rect.GetMinLat() << " .. " << rect.GetMaxLat()
      << ", lon: " << rect.GetMinLon() << " .. " << rect.GetMaxLon() << " ]";
  return out.str();
}
}  // namespace ms
