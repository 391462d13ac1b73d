#pragma once

#include "geometry/distance.hpp"
#include "geometry/distance_on_sphere.hpp"
#include "geometry/earth_model.hpp"
#include "geometry/latlon.hpp"
#include "geometry/point3d.hpp"

#include "base/assert.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/register/point.hpp>
#include <boost/geometry/index/rtree.hpp>

BOOST_GEOMETRY_REGISTER_POINT_3D(m3::PointD, double, boost::geometry::cs::cartesian, x, y, z)

namespace ms
{
struct NearestPoint
{
  size_t m_index;
  LatLon m_point;
  Distance m_distance;
};

/// \brief Nearest neighbour index over a fixed point set.
///
/// Points are stored in an R-tree by their Earth-centered Cartesian positions
/// (GetPointOnEarth). The chord between two positions is a lower bound of the
/// geodesic distance between them, so candidates are visited in the order of
/// growing chord and the search stops as soon as the chord exceeds the best
/// geodesic distance found. The answer is exact under the model's distance.
/// Equally distant points are resolved in favour of the lowest index.
///
/// The index is immutable after construction. Copies share the tree.
class NearestPointIndex
{
public:
  using Value = std::pair<m3::PointD, size_t>;
  using Tree = boost::geometry::index::rtree<Value, boost::geometry::index::quadratic<16>>;

  // Index of a point of the set and a distance to it in meters.
  struct Candidate
  {
    size_t m_index = 0;
    double m_meters = std::numeric_limits<double>::max();
  };

  /// Throws EmptyInputError if |points| is empty.
  NearestPointIndex(std::vector<LatLon> const & points,
                    EarthModel const & model = EarthModel::MeanSphere());

  size_t GetSize() const { return m_points->size(); }
  EarthModel const & GetModel() const { return m_model; }
  LatLon const & GetPoint(size_t index) const { return (*m_points)[index]; }

  NearestPoint FindNearest(LatLon const & query) const;

  /// True if some point of the set is not farther than |radiusMeters| from |query|.
  bool HasPointWithin(LatLon const & query, double radiusMeters) const;

  /// Same as FindNearest but with a custom metric. |distanceFn(index)| returns the
  /// distance in meters from the query to the point with |index|. It must never be
  /// less than the surface distance under the index model.
  template <typename DistanceFn>
  Candidate FindNearestBy(LatLon const & query, DistanceFn && distanceFn) const
  {
    auto const q = GetPointOnEarth(query, m_model);

    Candidate best;
    bool found = false;
    namespace bgi = boost::geometry::index;
    for (auto it = bgi::qbegin(*m_tree, bgi::nearest(q, CastSize(m_tree->size()))),
              end = bgi::qend(*m_tree);
         it != end; ++it)
    {
      if (found && m3::Distance(q, it->first) > best.m_meters + ChordSlack(best.m_meters))
        break;

      double const meters = distanceFn(it->second);
      if (!found || meters < best.m_meters ||
          (meters == best.m_meters && it->second < best.m_index))
      {
        best.m_index = it->second;
        best.m_meters = meters;
        found = true;
      }
    }

    CHECK(found, ("Nearest point query over an empty index"));
    return best;
  }

  template <typename DistanceFn>
  bool HasPointWithinBy(LatLon const & query, double radiusMeters, DistanceFn && distanceFn) const
  {
    auto const q = GetPointOnEarth(query, m_model);
    namespace bgi = boost::geometry::index;
    for (auto it = bgi::qbegin(*m_tree, bgi::nearest(q, CastSize(m_tree->size()))),
              end = bgi::qend(*m_tree);
         it != end; ++it)
    {
      if (m3::Distance(q, it->first) > radiusMeters + ChordSlack(radiusMeters))
        return false;
      if (distanceFn(it->second) <= radiusMeters)
        return true;
    }
    return false;
  }

private:
  static unsigned CastSize(size_t size) { return static_cast<unsigned>(size); }

  // Computed geodesic and chord lengths both carry rounding errors. The slack keeps
  // the search from stopping before a candidate which is equally close.
  static double ChordSlack(double meters) { return 1e-3 + meters * 1e-9; }

  std::shared_ptr<std::vector<LatLon> const> m_points;
  std::shared_ptr<Tree const> m_tree;
  EarthModel m_model;
};

std::string DebugPrint(NearestPoint const & nearest);
}  // namespace ms
