#include "geometry/distance_on_sphere.hpp"

#include "base/math.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <boost/geometry/formulas/karney_inverse.hpp>
#include <boost/geometry/srs/spheroid.hpp>

using namespace std;

namespace ms
{
namespace
{
using Spheroid = boost::geometry::srs::spheroid<double>;
using KarneyInverse =
    boost::geometry::formula::karney_inverse<double, true /* EnableDistance */,
                                             true /* EnableAzimuth */,
                                             true /* EnableReverseAzimuth */,
                                             false /* EnableReducedLength */,
                                             false /* EnableGeodesicScale */>;

// Distinct coordinates of the same place: a pole with any longitude or
// the antimeridian given as -180 and 180.
bool IsSamePlace(LatLon const & ll1, LatLon const & ll2)
{
  if (ll1.GetLat() != ll2.GetLat())
    return false;
  if (fabs(ll1.GetLat()) == LatLon::kMaxLat)
    return true;
  return ll1.GetLon() == ll2.GetLon() || fabs(ll1.GetLon() - ll2.GetLon()) == 360.0;
}

GeodesicSolution SolveOnSphere(LatLon const & ll1, LatLon const & ll2, double radius)
{
  GeodesicSolution solution;
  solution.m_distance = Distance::FromMeters(
      radius * DistanceOnSphere(ll1.GetLat(), ll1.GetLon(), ll2.GetLat(), ll2.GetLon()));

  // The final bearing at |ll2| is the reversed initial bearing of the way back.
  solution.m_bearings.m_initialDeg =
      InitialBearingOnSphere(ll1.GetLat(), ll1.GetLon(), ll2.GetLat(), ll2.GetLon());
  solution.m_bearings.m_finalDeg = NormalizeBearing(
      InitialBearingOnSphere(ll2.GetLat(), ll2.GetLon(), ll1.GetLat(), ll1.GetLon()) + 180.0);
  return solution;
}

GeodesicSolution SolveOnEllipsoid(LatLon const & ll1, LatLon const & ll2,
                                  EarthModel const & model)
{
  // Karney's method converges everywhere including nearly antipodal points.
  // It takes and returns degrees.
  Spheroid const spheroid(model.GetSemiMajorAxis(), model.GetSemiMinorAxis());
  auto const result =
      KarneyInverse::apply(ll1.GetLon(), ll1.GetLat(), ll2.GetLon(), ll2.GetLat(), spheroid);

  GeodesicSolution solution;
  solution.m_distance = Distance::FromMeters(result.distance);
  solution.m_bearings.m_initialDeg = NormalizeBearing(result.azimuth);
  solution.m_bearings.m_finalDeg = NormalizeBearing(result.reverse_azimuth);
  return solution;
}
}  // namespace

double DistanceOnSphere(double lat1Deg, double lon1Deg, double lat2Deg, double lon2Deg)
{
  double const lat1 = base::DegToRad(lat1Deg);
  double const lat2 = base::DegToRad(lat2Deg);
  double const dlat = sin((lat2 - lat1) * 0.5);
  double const dlon = sin((base::DegToRad(lon2Deg) - base::DegToRad(lon1Deg)) * 0.5);
  double const y = base::Clamp(dlat * dlat + dlon * dlon * cos(lat1) * cos(lat2), 0.0, 1.0);
  return 2.0 * atan2(sqrt(y), sqrt(max(0.0, 1.0 - y)));
}

double InitialBearingOnSphere(double lat1Deg, double lon1Deg, double lat2Deg, double lon2Deg)
{
  double const lat1 = base::DegToRad(lat1Deg);
  double const lat2 = base::DegToRad(lat2Deg);
  double const dlon = base::DegToRad(lon2Deg) - base::DegToRad(lon1Deg);

  double const y = sin(dlon) * cos(lat2);
  double const x = cos(lat1) * sin(lat2) - sin(lat1) * cos(lat2) * cos(dlon);
  return NormalizeBearing(base::RadToDeg(atan2(y, x)));
}

double NormalizeBearing(double deg)
{
  double result = fmod(deg, 360.0);
  if (result < 0.0)
    result += 360.0;
  // fmod of a tiny negative value plus 360 rounds to 360.
  if (result >= 360.0)
    result = 0.0;
  return result;
}

GeodesicSolution SolveInverse(LatLon const & ll1, LatLon const & ll2, EarthModel const & model)
{
  // Bearings of a degenerate geodesic are (0, 0) by convention.
  if (IsSamePlace(ll1, ll2))
    return {};

  if (model.IsSphere())
    return SolveOnSphere(ll1, ll2, model.GetSemiMajorAxis());
  return SolveOnEllipsoid(ll1, ll2, model);
}

Distance DistanceOnEarth(LatLon const & ll1, LatLon const & ll2, EarthModel const & model)
{
  return SolveInverse(ll1, ll2, model).m_distance;
}

Distance DistanceOnEarth(LatLonAlt const & lla1, LatLonAlt const & lla2,
                         EarthModel const & model)
{
  double const surface = DistanceOnEarth(lla1.GetLatLon(), lla2.GetLatLon(), model).GetMeters();
  double const dh = lla2.GetAltitude() - lla1.GetAltitude();
  return Distance::FromMeters(hypot(surface, dh));
}

Bearings BearingsOnEarth(LatLon const & ll1, LatLon const & ll2, EarthModel const & model)
{
  return SolveInverse(ll1, ll2, model).m_bearings;
}

m3::PointD GetPointOnSphere(LatLon const & ll, double sphereRadius)
{
  // The point (lat=0, lon=0)   translates to (x=1, y=0, z=0).
  // The point (lat=0, lon=+90°) translates to (x=0, y=1, z=0).
  // The point (lat=+90°, lon=0) translates to (x=0, y=0, z=1).

  double const latRad = base::DegToRad(ll.GetLat());
  double const lonRad = base::DegToRad(ll.GetLon());

  double const x = sphereRadius * cos(latRad) * cos(lonRad);
  double const y = sphereRadius * cos(latRad) * sin(lonRad);
  double const z = sphereRadius * sin(latRad);

  return {x, y, z};
}

m3::PointD GetPointOnEarth(LatLon const & ll, EarthModel const & model)
{
  if (model.IsSphere())
    return GetPointOnSphere(ll, model.GetSemiMajorAxis());

  // Geodetic to ECEF with zero height, N is the prime vertical radius of curvature.
  double const a = model.GetSemiMajorAxis();
  double const f = model.GetFlattening();
  double const e2 = f * (2.0 - f);

  double const latRad = base::DegToRad(ll.GetLat());
  double const lonRad = base::DegToRad(ll.GetLon());
  double const sinLat = sin(latRad);
  double const n = a / sqrt(1.0 - e2 * sinLat * sinLat);

  double const x = n * cos(latRad) * cos(lonRad);
  double const y = n * cos(latRad) * sin(lonRad);
  double const z = n * (1.0 - e2) * sinLat;

  return {x, y, z};
}

string DebugPrint(Bearings const & bearings)
{
  ostringstream out;
  out << setprecision(20);
  out << "Bearings [ initial: " << bearings.m_initialDeg << ", final: " << bearings.m_finalDeg
      << " ]";
  return out.str();
}

string DebugPrint(GeodesicSolution const & solution)
{
  ostringstream out;
  out << "GeodesicSolution [ " << DebugPrint(solution.m_distance) << ", "
      << DebugPrint(solution.m_bearings) << " ]";
  return out.str();
}
}  // namespace ms
