#include "testing/testing.hpp"

#include "geometry/geometry_exceptions.hpp"
#include "geometry/latlon.hpp"

#include <limits>

UNIT_TEST(LatLon_Bounds)
{
  TEST_THROW(ms::LatLon(91.0, 0.0), ms::OutOfRangeError, ());
  TEST_NO_THROW(ms::LatLon(90.0, 0.0), ());
  TEST_NO_THROW(ms::LatLon(-90.0, -180.0), ());
  TEST_NO_THROW(ms::LatLon(0.0, 180.0), ());
  TEST_THROW(ms::LatLon(-90.5, 0.0), ms::OutOfRangeError, ());
  TEST_THROW(ms::LatLon(0.0, 180.000001), ms::OutOfRangeError, ());
  TEST_THROW(ms::LatLon(0.0, -181.0), ms::OutOfRangeError, ());
}

UNIT_TEST(LatLon_NotFinite)
{
  double const nan = std::numeric_limits<double>::quiet_NaN();
  double const inf = std::numeric_limits<double>::infinity();
  TEST_THROW(ms::LatLon(nan, 0.0), ms::OutOfRangeError, ());
  TEST_THROW(ms::LatLon(0.0, nan), ms::OutOfRangeError, ());
  TEST_THROW(ms::LatLon(inf, 0.0), ms::OutOfRangeError, ());
  TEST_THROW(ms::LatLon(0.0, -inf), ms::OutOfRangeError, ());
  TEST(!ms::LatLon::IsValid(nan, 0.0), ());
}

UNIT_TEST(LatLon_OutOfRangeIsValidationError)
{
  // Callers which don't care about the reason catch the base class.
  TEST_THROW(ms::LatLon(0.0, 200.0), ms::ValidationError, ());
  TEST_THROW(ms::LatLon(0.0, 200.0), RootException, ());
}

UNIT_TEST(LatLon_IsValid)
{
  TEST(ms::LatLon::IsValid(90.0, 180.0), ());
  TEST(ms::LatLon::IsValid(-90.0, -180.0), ());
  TEST(!ms::LatLon::IsValid(90.1, 0.0), ());
  TEST(!ms::LatLon::IsValid(0.0, -180.1), ());
  TEST(ms::LatLon::IsValidLat(45.0), ());
  TEST(!ms::LatLon::IsValidLon(1000.0), ());
}

UNIT_TEST(LatLon_Equality)
{
  ms::LatLon const a(55.75, 37.61);
  TEST_EQUAL(a, ms::LatLon(55.75, 37.61), ());
  TEST_NOT_EQUAL(a, ms::LatLon(55.75, 37.62), ());
  TEST(a.EqualDxDy(ms::LatLon(55.7500001, 37.6099999), 1e-6), ());
  TEST(!a.EqualDxDy(ms::LatLon(55.76, 37.61), 1e-6), ());
  TEST_EQUAL(a.GetLat(), 55.75, ());
  TEST_EQUAL(a.GetLon(), 37.61, ());
}

UNIT_TEST(LatLonAlt_Smoke)
{
  ms::LatLonAlt const p(10.0, -20.0, 1500.0);
  TEST_EQUAL(p.GetLatLon(), ms::LatLon(10.0, -20.0), ());
  TEST_EQUAL(p.GetAltitude(), 1500.0, ());
  TEST_EQUAL(p, ms::LatLonAlt(ms::LatLon(10.0, -20.0), 1500.0), ());
  TEST_NOT_EQUAL(p, ms::LatLonAlt(10.0, -20.0, 1501.0), ());

  TEST_THROW(ms::LatLonAlt(95.0, 0.0, 0.0), ms::OutOfRangeError, ());
  TEST_THROW(ms::LatLonAlt(0.0, 0.0, std::numeric_limits<double>::infinity()),
             ms::OutOfRangeError, ());
}

UNIT_TEST(LatLon_DebugPrint)
{
  TEST_EQUAL(DebugPrint(ms::LatLon(1.5, -2.25)), "ms::LatLon(1.5, -2.25)", ());
  TEST_EQUAL(DebugPrint(ms::LatLonAlt(1.5, -2.25, 10.0)), "ms::LatLonAlt(1.5, -2.25, 10)", ());
}
