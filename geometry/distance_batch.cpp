#include "geometry/distance_batch.hpp"

#include "geometry/geometry_exceptions.hpp"

#include "base/logging.hpp"

#include <sstream>

namespace ms
{
namespace
{
// Runs |fn| over every element of |pairs|, turning a thrown ValidationError into a
// BatchElementError which carries the element index.
template <typename Value, typename Pair, typename Fn>
std::vector<BatchResult<Value>> EvaluateBatch(std::vector<Pair> const & pairs, Fn && fn)
{
  std::vector<BatchResult<Value>> results;
  results.reserve(pairs.size());
  for (size_t i = 0; i < pairs.size(); ++i)
  {
    try
    {
      results.emplace_back(fn(pairs[i]));
    }
    catch (ValidationError const & e)
    {
      results.emplace_back(BatchElementError{i, e.Msg()});
    }
  }

  auto const failures = CountFailures(results);
  if (failures != 0)
    LOG(LDEBUG, ("Batch of", pairs.size(), "elements has", failures, "failed elements"));
  return results;
}

std::pair<LatLon, LatLon> MakePair(RawPointPair const & pair)
{
  return {LatLon(pair.m_lat1, pair.m_lon1), LatLon(pair.m_lat2, pair.m_lon2)};
}
}  // namespace

std::vector<DistanceResult> DistanceBatch(std::vector<RawPointPair> const & pairs,
                                          EarthModel const & model)
{
  return EvaluateBatch<Distance>(pairs, [&model](RawPointPair const & raw) {
    auto const p = MakePair(raw);
    return DistanceOnEarth(p.first, p.second, model);
  });
}

std::vector<DistanceResult> DistanceBatch(std::vector<LatLonPair> const & pairs,
                                          EarthModel const & model)
{
  return EvaluateBatch<Distance>(pairs, [&model](LatLonPair const & p) {
    return DistanceOnEarth(p.first, p.second, model);
  });
}

std::vector<BearingsResult> BearingsBatch(std::vector<RawPointPair> const & pairs,
                                          EarthModel const & model)
{
  return EvaluateBatch<Bearings>(pairs, [&model](RawPointPair const & raw) {
    auto const p = MakePair(raw);
    return BearingsOnEarth(p.first, p.second, model);
  });
}

std::string DebugPrint(BatchElementError const & error)
{
  std::ostringstream out;
  out << "BatchElementError [ index: " << error.m_index << ", reason: " << error.m_reason << " ]";
  return out.str();
}

std::string DebugPrint(RawPointPair const & pair)
{
  std::ostringstream out;
  out.precision(20);
  out << "RawPointPair [ " << pair.m_lat1 << ", " << pair.m_lon1 << " -> " << pair.m_lat2 << ", "
      << pair.m_lon2 << " ]";
  return out.str();
}
}  // namespace ms
