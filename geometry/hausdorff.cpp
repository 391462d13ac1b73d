#include "geometry/hausdorff.hpp"

#include "geometry/distance_on_sphere.hpp"
#include "geometry/geometry_exceptions.hpp"
#include "geometry/nearest_point_index.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"

#include <limits>
#include <utility>

using namespace std;

namespace ms
{
namespace
{
using Candidate = NearestPointIndex::Candidate;

LatLon const & ToLatLon(LatLon const & ll) { return ll; }
LatLon const & ToLatLon(LatLonAlt const & lla) { return lla.GetLatLon(); }

double Meters(LatLon const & p1, LatLon const & p2, EarthModel const & model)
{
  return DistanceOnEarth(p1, p2, model).GetMeters();
}

double Meters(LatLonAlt const & p1, LatLonAlt const & p2, EarthModel const & model)
{
  return DistanceOnEarth(p1, p2, model).GetMeters();
}

template <typename Point>
vector<LatLon> ToLatLons(vector<Point> const & points)
{
  vector<LatLon> result;
  result.reserve(points.size());
  for (auto const & p : points)
    result.push_back(ToLatLon(p));
  return result;
}

// Scans all target points. Equally distant points resolve to the lowest index.
template <typename Point>
class BruteForceSearch
{
public:
  BruteForceSearch(vector<Point> const & targets, EarthModel const & model)
    : m_targets(targets), m_model(model)
  {
  }

  Candidate FindNearest(Point const & query) const
  {
    Candidate best;
    for (size_t i = 0; i < m_targets.size(); ++i)
    {
      double const meters = Meters(query, m_targets[i], m_model);
      if (meters < best.m_meters)
      {
        best.m_index = i;
        best.m_meters = meters;
      }
    }
    return best;
  }

  bool HasPointWithin(Point const & query, double radiusMeters) const
  {
    for (auto const & target : m_targets)
    {
      if (Meters(query, target, m_model) <= radiusMeters)
        return true;
    }
    return false;
  }

private:
  vector<Point> const & m_targets;
  EarthModel const & m_model;
};

// Queries an R-tree built over the surface positions of the targets. The metric of
// |Point| is never less than the surface distance, so the index search stays exact.
template <typename Point>
class IndexedSearch
{
public:
  IndexedSearch(vector<Point> const & targets, EarthModel const & model)
    : m_targets(targets), m_model(model), m_index(ToLatLons(targets), model)
  {
  }

  Candidate FindNearest(Point const & query) const
  {
    return m_index.FindNearestBy(ToLatLon(query), [this, &query](size_t i) {
      return Meters(query, m_targets[i], m_model);
    });
  }

  bool HasPointWithin(Point const & query, double radiusMeters) const
  {
    return m_index.HasPointWithinBy(ToLatLon(query), radiusMeters, [this, &query](size_t i) {
      return Meters(query, m_targets[i], m_model);
    });
  }

private:
  vector<Point> const & m_targets;
  EarthModel const & m_model;
  NearestPointIndex m_index;
};

template <typename Point, typename Search>
BasicHausdorffWitness<Point> ComputeDirected(vector<Point> const & a, vector<Point> const & b,
                                             Search const & search,
                                             HausdorffParams const & params)
{
  optional<LatLonRect> clipRect;
  if (params.m_clip)
    clipRect = LatLonRect::FromPoints(ToLatLons(b)).Expanded(params.m_clipSlackDeg);

  bool found = false;
  size_t sourceIndex = 0;
  Candidate worst;
  size_t pruned = 0;
  for (size_t i = 0; i < a.size(); ++i)
  {
    // A point with some target not farther than the current maximum can neither
    // raise the maximum nor replace the witness, which needs a strictly larger value.
    if (found && clipRect && clipRect->Contains(ToLatLon(a[i])) &&
        search.HasPointWithin(a[i], worst.m_meters))
    {
      ++pruned;
      continue;
    }

    auto const nearest = search.FindNearest(a[i]);
    if (!found || nearest.m_meters > worst.m_meters)
    {
      found = true;
      sourceIndex = i;
      worst = nearest;
    }
  }

  CHECK(found, ());
  if (params.m_clip)
    LOG(LDEBUG, ("Clipping has skipped", pruned, "of", a.size(), "source points"));

  return {sourceIndex, a[sourceIndex], worst.m_index, b[worst.m_index],
          Distance::FromMeters(worst.m_meters)};
}

template <typename Point>
void CheckNotEmpty(vector<Point> const & a, vector<Point> const & b)
{
  if (a.empty() || b.empty())
  {
    MYTHROW(EmptyInputError,
            ("Hausdorff distance is undefined for an empty point set, sizes:", a.size(), b.size()));
  }
}

template <typename Point>
BasicHausdorffWitness<Point> Directed(vector<Point> const & a, vector<Point> const & b,
                                      EarthModel const & model, HausdorffParams const & params)
{
  CheckNotEmpty(a, b);

  auto const strategy = params.m_strategy ? *params.m_strategy
                                          : ChooseHausdorffStrategy(a.size(), b.size(), params);
  LOG(LDEBUG, ("Directed Hausdorff over", a.size(), "and", b.size(), "points, strategy:",
               strategy, "model:", model));

  switch (strategy)
  {
  case HausdorffStrategy::BruteForce:
    return ComputeDirected(a, b, BruteForceSearch<Point>(b, model), params);
  case HausdorffStrategy::Indexed:
    return ComputeDirected(a, b, IndexedSearch<Point>(b, model), params);
  }
  UNREACHABLE();
}

template <typename Point>
BasicSymmetricHausdorffResult<Point> Symmetric(vector<Point> const & a, vector<Point> const & b,
                                               EarthModel const & model,
                                               HausdorffParams const & params)
{
  CheckNotEmpty(a, b);

  auto aToB = Directed(a, b, model, params);
  auto bToA = Directed(b, a, model, params);
  auto const distance = max(aToB.m_distance, bToA.m_distance);
  return {distance, move(aToB), move(bToA)};
}

// Points of a set which lie in a rect together with their indices in the set.
struct FilteredSet
{
  vector<LatLon> m_points;
  vector<size_t> m_indices;
};

FilteredSet FilterByRect(vector<LatLon> const & points, LatLonRect const & rect, char const * name)
{
  FilteredSet result;
  for (size_t i = 0; i < points.size(); ++i)
  {
    if (!rect.Contains(points[i]))
      continue;
    result.m_points.push_back(points[i]);
    result.m_indices.push_back(i);
  }

  if (result.m_points.empty())
    MYTHROW(EmptyInputError, ("No point of set", name, "lies in", rect));
  return result;
}

void RestoreIndices(HausdorffWitness & witness, FilteredSet const & source,
                    FilteredSet const & target)
{
  witness.m_sourceIndex = source.m_indices[witness.m_sourceIndex];
  witness.m_targetIndex = target.m_indices[witness.m_targetIndex];
}
}  // namespace

HausdorffStrategy ChooseHausdorffStrategy(size_t sizeA, size_t sizeB,
                                          HausdorffParams const & params)
{
  if (min(sizeA, sizeB) < params.m_minIndexedSetSize || sizeB == 0)
    return HausdorffStrategy::BruteForce;
  // sizeA * sizeB <= m_maxBruteForcePairs without an overflow.
  if (sizeA <= params.m_maxBruteForcePairs / sizeB)
    return HausdorffStrategy::BruteForce;
  return HausdorffStrategy::Indexed;
}

HausdorffWitness DirectedHausdorff(vector<LatLon> const & a, vector<LatLon> const & b,
                                   EarthModel const & model, HausdorffParams const & params)
{
  return Directed(a, b, model, params);
}

SymmetricHausdorffResult SymmetricHausdorff(vector<LatLon> const & a, vector<LatLon> const & b,
                                            EarthModel const & model,
                                            HausdorffParams const & params)
{
  return Symmetric(a, b, model, params);
}

HausdorffWitness DirectedHausdorffInRect(vector<LatLon> const & a, vector<LatLon> const & b,
                                         LatLonRect const & rect, EarthModel const & model,
                                         HausdorffParams const & params)
{
  auto const filteredA = FilterByRect(a, rect, "A");
  auto const filteredB = FilterByRect(b, rect, "B");

  auto witness = Directed(filteredA.m_points, filteredB.m_points, model, params);
  RestoreIndices(witness, filteredA, filteredB);
  return witness;
}

SymmetricHausdorffResult SymmetricHausdorffInRect(vector<LatLon> const & a,
                                                  vector<LatLon> const & b,
                                                  LatLonRect const & rect,
                                                  EarthModel const & model,
                                                  HausdorffParams const & params)
{
  auto const filteredA = FilterByRect(a, rect, "A");
  auto const filteredB = FilterByRect(b, rect, "B");

  auto result = Symmetric(filteredA.m_points, filteredB.m_points, model, params);
  RestoreIndices(result.m_aToB, filteredA, filteredB);
  RestoreIndices(result.m_bToA, filteredB, filteredA);
  return result;
}

HausdorffWitness3D DirectedHausdorff(vector<LatLonAlt> const & a, vector<LatLonAlt> const & b,
                                     EarthModel const & model, HausdorffParams const & params)
{
  return Directed(a, b, model, params);
}

SymmetricHausdorffResult3D SymmetricHausdorff(vector<LatLonAlt> const & a,
                                              vector<LatLonAlt> const & b,
                                              EarthModel const & model,
                                              HausdorffParams const & params)
{
  return Symmetric(a, b, model, params);
}

string DebugPrint(HausdorffStrategy strategy)
{
  switch (strategy)
  {
  case HausdorffStrategy::BruteForce: return "BruteForce";
  case HausdorffStrategy::Indexed: return "Indexed";
  }
  UNREACHABLE();
}

string DebugPrint(HausdorffParams const & params)
{
  ostringstream out;
  out << "HausdorffParams [ minIndexedSetSize: " << params.m_minIndexedSetSize
      << ", maxBruteForcePairs: " << params.m_maxBruteForcePairs
      << ", clip: " << (params.m_clip ? "true" : "false") << ", clipSlackDeg: " << params.m_clipSlackDeg
      << ", strategy: " << (params.m_strategy ? DebugPrint(*params.m_strategy) : "auto")
      << " ]";
  return out.str();
}
}  // namespace ms
