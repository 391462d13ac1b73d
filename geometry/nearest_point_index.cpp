#include "geometry/nearest_point_index.hpp"

#include "geometry/geometry_exceptions.hpp"

#include "base/logging.hpp"

#include <sstream>

namespace ms
{
namespace
{
std::vector<NearestPointIndex::Value> MakeValues(std::vector<LatLon> const & points,
                                                 EarthModel const & model)
{
  std::vector<NearestPointIndex::Value> values;
  values.reserve(points.size());
  for (size_t i = 0; i < points.size(); ++i)
    values.emplace_back(GetPointOnEarth(points[i], model), i);
  return values;
}
}  // namespace

NearestPointIndex::NearestPointIndex(std::vector<LatLon> const & points,
                                     EarthModel const & model)
  : m_model(model)
{
  if (points.empty())
    MYTHROW(EmptyInputError, ("Can't build a nearest point index over an empty point set"));

  m_points = std::make_shared<std::vector<LatLon> const>(points);
  // The range constructor packs the tree, the layout depends on the input only.
  auto const values = MakeValues(points, model);
  m_tree = std::make_shared<Tree const>(values.begin(), values.end());

  LOG(LDEBUG, ("Nearest point index is built over", points.size(), "points on", model));
}

NearestPoint NearestPointIndex::FindNearest(LatLon const & query) const
{
  auto const best = FindNearestBy(query, [this, &query](size_t index) {
    return DistanceOnEarth(query, GetPoint(index), m_model).GetMeters();
  });
  return {best.m_index, GetPoint(best.m_index), Distance::FromMeters(best.m_meters)};
}

bool NearestPointIndex::HasPointWithin(LatLon const & query, double radiusMeters) const
{
  return HasPointWithinBy(query, radiusMeters, [this, &query](size_t index) {
    return DistanceOnEarth(query, GetPoint(index), m_model).GetMeters();
  });
}

std::string DebugPrint(NearestPoint const & nearest)
{
  std::ostringstream out;
  out << "NearestPoint [ " << nearest.m_index << ", " << DebugPrint(nearest.m_point) << ", "
      << DebugPrint(nearest.m_distance) << " ]";
  return out.str();
}
}  // namespace ms
