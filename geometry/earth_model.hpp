#pragma once

#include <string>

namespace ms
{
// IUGG mean radius of the WGS84 ellipsoid, (2a + b) / 3 rounded to decimeters.
double constexpr kEarthMeanRadiusMeters = 6371008.8;

double constexpr kWgs84SemiMajorAxisMeters = 6378137.0;
double constexpr kWgs84InverseFlattening = 298.257223563;
double constexpr kGrs80SemiMajorAxisMeters = 6378137.0;
double constexpr kGrs80InverseFlattening = 298.257222101;

/// \brief Shape of the Earth used by the geodesic kernel: a sphere or an
/// ellipsoid of revolution. Immutable, cheap to copy and safe to share
/// between threads.
class EarthModel
{
public:
  enum class Type
  {
    Sphere,
    Ellipsoid
  };

  /// Throws ValidationError if |radiusMeters| is not a finite positive number.
  static EarthModel Sphere(double radiusMeters);
  /// Throws ValidationError if |semiMajorAxisMeters| is not a finite positive number
  /// or |inverseFlattening| is not finite and greater than one.
  static EarthModel Ellipsoid(double semiMajorAxisMeters, double inverseFlattening);

  /// Sphere of radius kEarthMeanRadiusMeters. Default model of the kernel.
  static EarthModel const & MeanSphere();
  static EarthModel const & WGS84();
  static EarthModel const & GRS80();

  /// Looks up a preset by name: "sphere", "wgs84" or "grs80", case-insensitive.
  /// Throws ValidationError for an unknown name.
  static EarthModel const & FromName(std::string const & name);

  Type GetType() const { return m_type; }
  bool IsSphere() const { return m_type == Type::Sphere; }
  std::string const & GetName() const { return m_name; }

  double GetSemiMajorAxis() const { return m_semiMajorAxis; }
  double GetSemiMinorAxis() const { return m_semiMinorAxis; }
  /// Zero for a sphere.
  double GetFlattening() const { return m_flattening; }
  /// Radius of the sphere or mean radius (2a + b) / 3 of the ellipsoid.
  double GetMeanRadius() const;

  bool operator==(EarthModel const & rhs) const;
  bool operator!=(EarthModel const & rhs) const { return !(*this == rhs); }

private:
  EarthModel(Type type, std::string const & name, double semiMajorAxis, double flattening);

  Type m_type;
  std::string m_name;
  double m_semiMajorAxis;
  double m_semiMinorAxis;
  double m_flattening;
};

std::string DebugPrint(EarthModel::Type type);
std::string DebugPrint(EarthModel const & model);
}  // namespace ms
