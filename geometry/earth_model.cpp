#include "geometry/earth_model.hpp"

#include "geometry/geometry_exceptions.hpp"

#include "base/assert.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ms
{
namespace
{
std::string ToLower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}
}  // namespace

EarthModel::EarthModel(Type type, std::string const & name, double semiMajorAxis,
                       double flattening)
  : m_type(type)
  , m_name(name)
  , m_semiMajorAxis(semiMajorAxis)
  , m_semiMinorAxis(semiMajorAxis * (1.0 - flattening))
  , m_flattening(flattening)
{
}

// static
EarthModel EarthModel::Sphere(double radiusMeters)
{
  if (!std::isfinite(radiusMeters) || radiusMeters <= 0.0)
    MYTHROW(ValidationError, ("Sphere radius must be finite and positive:", radiusMeters));
  return EarthModel(Type::Sphere, "sphere", radiusMeters, 0.0 /* flattening */);
}

// static
EarthModel EarthModel::Ellipsoid(double semiMajorAxisMeters, double inverseFlattening)
{
  if (!std::isfinite(semiMajorAxisMeters) || semiMajorAxisMeters <= 0.0)
  {
    MYTHROW(ValidationError,
            ("Semi-major axis must be finite and positive:", semiMajorAxisMeters));
  }
  if (!std::isfinite(inverseFlattening) || inverseFlattening <= 1.0)
  {
    MYTHROW(ValidationError,
            ("Inverse flattening must be finite and greater than one:", inverseFlattening));
  }
  return EarthModel(Type::Ellipsoid, "ellipsoid", semiMajorAxisMeters, 1.0 / inverseFlattening);
}

// static
EarthModel const & EarthModel::MeanSphere()
{
  static EarthModel const kModel(Type::Sphere, "sphere", kEarthMeanRadiusMeters, 0.0);
  return kModel;
}

// static
EarthModel const & EarthModel::WGS84()
{
  static EarthModel const kModel(Type::Ellipsoid, "wgs84", kWgs84SemiMajorAxisMeters,
                                 1.0 / kWgs84InverseFlattening);
  return kModel;
}

// static
EarthModel const & EarthModel::GRS80()
{
  static EarthModel const kModel(Type::Ellipsoid, "grs80", kGrs80SemiMajorAxisMeters,
                                 1.0 / kGrs80InverseFlattening);
  return kModel;
}

// static
EarthModel const & EarthModel::FromName(std::string const & name)
{
  auto const lowered = ToLower(name);
  if (lowered == "sphere")
    return MeanSphere();
  if (lowered == "wgs84")
    return WGS84();
  if (lowered == "grs80")
    return GRS80();
  MYTHROW(ValidationError, ("Unknown Earth model name:", name));
}

double EarthModel::GetMeanRadius() const
{
  if (IsSphere())
    return m_semiMajorAxis;
  return (2.0 * m_semiMajorAxis + m_semiMinorAxis) / 3.0;
}

bool EarthModel::operator==(EarthModel const & rhs) const
{
  return m_type == rhs.m_type && m_semiMajorAxis == rhs.m_semiMajorAxis &&
         m_flattening == rhs.m_flattening;
}

std::string DebugPrint(EarthModel::Type type)
{
  switch (type)
  {
  case EarthModel::Type::Sphere: return "Sphere";
  case EarthModel::Type::Ellipsoid: return "Ellipsoid";
  }
  UNREACHABLE();
}

std::string DebugPrint(EarthModel const & model)
{
  std::ostringstream out;
  out << std::setprecision(20);
  out << "EarthModel [ " << DebugPrint(model.GetType()) << ", " << model.GetName()
      << ", a: " << model.GetSemiMajorAxis() << ", f: " << model.GetFlattening() << " ]";
  return out.str();
}
}  // namespace ms
