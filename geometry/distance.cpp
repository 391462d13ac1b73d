#include "geometry/distance.hpp"

#include "geometry/geometry_exceptions.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace ms
{
// static
Distance Distance::FromMeters(double meters)
{
  if (!std::isfinite(meters))
    MYTHROW(ValidationError, ("Distance", meters, "is not finite"));
  if (meters < 0.0)
    MYTHROW(ValidationError, ("Distance", meters, "is negative"));
  // Drops the sign of -0.0.
  return Distance(meters == 0.0 ? 0.0 : meters);
}

std::string DebugPrint(Distance const & distance)
{
  std::ostringstream out;
  out << std::setprecision(20) << distance.GetMeters() << " m";
  return out.str();
}
}  // namespace ms
