#pragma once

#include <string>

namespace ms
{
/// \brief Non-negative finite length in meters.
class Distance
{
public:
  Distance() = default;

  /// Throws ValidationError if |meters| is negative or is not finite.
  static Distance FromMeters(double meters);

  double GetMeters() const { return m_meters; }
  double GetKilometers() const { return m_meters / 1000.0; }

  bool operator==(Distance const & rhs) const { return m_meters == rhs.m_meters; }
  bool operator!=(Distance const & rhs) const { return m_meters != rhs.m_meters; }
  bool operator<(Distance const & rhs) const { return m_meters < rhs.m_meters; }
  bool operator<=(Distance const & rhs) const { return m_meters <= rhs.m_meters; }
  bool operator>(Distance const & rhs) const { return m_meters > rhs.m_meters; }
  bool operator>=(Distance const & rhs) const { return m_meters >= rhs.m_meters; }

private:
  explicit Distance(double meters) : m_meters(meters) {}

  double m_meters = 0.0;
};

std::string DebugPrint(Distance const & distance);
}  // namespace ms
