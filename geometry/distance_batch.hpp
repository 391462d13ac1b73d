#pragma once

#include "geometry/distance.hpp"
#include "geometry/distance_on_sphere.hpp"
#include "geometry/earth_model.hpp"
#include "geometry/latlon.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ms
{
/// \brief Unvalidated pair of coordinates as it comes from an outer data container.
struct RawPointPair
{
  double m_lat1 = 0.0;
  double m_lon1 = 0.0;
  double m_lat2 = 0.0;
  double m_lon2 = 0.0;
};

/// \brief Failure of a single element of a batch. Never aborts the other elements.
struct BatchElementError
{
  size_t m_index = 0;
  std::string m_reason;
};

/// \brief Outcome of one element of a batch: either a value or a BatchElementError.
template <typename Value>
class BatchResult
{
public:
  explicit BatchResult(Value const & value) : m_value(value) {}
  explicit BatchResult(BatchElementError const & error) : m_error(error) {}

  bool IsOk() const { return m_value.has_value(); }

  /// Should be called for successful results only.
  Value const & GetValue() const { return *m_value; }
  /// Should be called for failed results only.
  BatchElementError const & GetError() const { return *m_error; }

private:
  std::optional<Value> m_value;
  std::optional<BatchElementError> m_error;
};

using DistanceResult = BatchResult<Distance>;
using BearingsResult = BatchResult<Bearings>;

using LatLonPair = std::pair<LatLon, LatLon>;

// All the functions below return one result per input element in the input order.
std::vector<DistanceResult> DistanceBatch(std::vector<RawPointPair> const & pairs,
                                          EarthModel const & model = EarthModel::MeanSphere());
std::vector<DistanceResult> DistanceBatch(std::vector<LatLonPair> const & pairs,
                                          EarthModel const & model = EarthModel::MeanSphere());
std::vector<BearingsResult> BearingsBatch(std::vector<RawPointPair> const & pairs,
                                          EarthModel const & model = EarthModel::MeanSphere());

// Number of failed elements of |results|.
template <typename Value>
size_t CountFailures(std::vector<BatchResult<Value>> const & results)
{
  size_t count = 0;
  for (auto const & r : results)
  {
    if (!r.IsOk())
      ++count;
  }
  return count;
}

std::string DebugPrint(BatchElementError const & error);
std::string DebugPrint(RawPointPair const & pair);
}  // namespace ms
