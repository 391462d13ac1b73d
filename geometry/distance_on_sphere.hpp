#pragma once

#include "geometry/distance.hpp"
#include "geometry/earth_model.hpp"
#include "geometry/latlon.hpp"
#include "geometry/point3d.hpp"

#include <string>

// namespace ms - "math on sphere", similar to namespace m2.
namespace ms
{
// Upper bound of |sphere - ellipsoid| / ellipsoid for distances measured on
// MeanSphere() and WGS84() along short (up to a few hundred km) paths near
// the equator. The spherical model is off by up to ~0.56% along meridians.
double constexpr kSphereEllipsoidMaxRelativeDifference = 0.006;

/// \brief Initial and final bearings of a geodesic in degrees from true north, in [0, 360).
/// \note Bearings of a zero length geodesic are undefined, the kernel returns (0, 0) for it.
/// Equal coordinates, a pole with different longitudes and longitudes -180 and 180
/// at the same latitude all give the zero length geodesic.
struct Bearings
{
  double m_initialDeg = 0.0;
  double m_finalDeg = 0.0;
};

struct GeodesicSolution
{
  Distance m_distance;
  Bearings m_bearings;
};

// Distance on unit sphere between (lat1, lon1) and (lat2, lon2).
// lat1, lat2, lon1, lon2 - in degrees.
double DistanceOnSphere(double lat1Deg, double lon1Deg, double lat2Deg, double lon2Deg);

// Initial bearing in degrees of the great circle from (lat1, lon1) to (lat2, lon2), in [0, 360).
double InitialBearingOnSphere(double lat1Deg, double lon1Deg, double lat2Deg, double lon2Deg);

// Returns |deg| wrapped into [0, 360).
double NormalizeBearing(double deg);

/// Solves the inverse geodesic problem. Spheres use the haversine formula,
/// ellipsoids use Karney's method. Distance and bearings always come from
/// the same solution.
GeodesicSolution SolveInverse(LatLon const & ll1, LatLon const & ll2,
                              EarthModel const & model = EarthModel::MeanSphere());

// Distance in meters on Earth between |ll1| and |ll2|.
Distance DistanceOnEarth(LatLon const & ll1, LatLon const & ll2,
                         EarthModel const & model = EarthModel::MeanSphere());

// Straight-line combination of the surface distance and the altitude difference:
// sqrt(surface^2 + dh^2).
Distance DistanceOnEarth(LatLonAlt const & lla1, LatLonAlt const & lla2,
                         EarthModel const & model = EarthModel::MeanSphere());

Bearings BearingsOnEarth(LatLon const & ll1, LatLon const & ll2,
                         EarthModel const & model = EarthModel::MeanSphere());

m3::PointD GetPointOnSphere(LatLon const & ll, double sphereRadius);

// Earth-centered Earth-fixed position of |ll| on the surface of |model|.
// The chord between two such points never exceeds the geodesic distance.
m3::PointD GetPointOnEarth(LatLon const & ll, EarthModel const & model);

std::string DebugPrint(Bearings const & bearings);
std::string DebugPrint(GeodesicSolution const & solution);
}  // namespace ms
