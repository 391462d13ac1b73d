#pragma once

#include "geometry/distance.hpp"
#include "geometry/earth_model.hpp"
#include "geometry/latlon.hpp"
#include "geometry/latlon_rect.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ms
{
// Below this size of either set the brute-force scan is used.
size_t constexpr kMinIndexedSetSize = 32;
// The brute-force scan is used while |A| * |B| does not exceed this number of pairs.
size_t constexpr kMaxBruteForcePairs = 4000;
// Default margin around the target set's bounding box for clipping, in degrees.
double constexpr kDefaultClipSlackDeg = 1.0;

enum class HausdorffStrategy
{
  BruteForce,
  Indexed
};

struct HausdorffParams
{
  size_t m_minIndexedSetSize = kMinIndexedSetSize;
  size_t m_maxBruteForcePairs = kMaxBruteForcePairs;

  // Skip points of the source set which are known not to raise the maximum.
  // Never changes the result.
  bool m_clip = false;
  double m_clipSlackDeg = kDefaultClipSlackDeg;

  // Overrides ChooseHausdorffStrategy() when set.
  std::optional<HausdorffStrategy> m_strategy;
};

/// \brief Pair of points which realizes a directed Hausdorff distance.
/// m_source belongs to the source set, m_target is its nearest point in the target set.
template <typename Point>
struct BasicHausdorffWitness
{
  size_t m_sourceIndex;
  Point m_source;
  size_t m_targetIndex;
  Point m_target;
  Distance m_distance;
};

using HausdorffWitness = BasicHausdorffWitness<LatLon>;
using HausdorffWitness3D = BasicHausdorffWitness<LatLonAlt>;

template <typename Point>
struct BasicSymmetricHausdorffResult
{
  // Witness with the larger distance, the A to B one when both are equal.
  BasicHausdorffWitness<Point> const & GetDominant() const
  {
    return m_bToA.m_distance > m_aToB.m_distance ? m_bToA : m_aToB;
  }

  Distance m_distance;
  // Source points of |m_aToB| are from A, source points of |m_bToA| are from B.
  BasicHausdorffWitness<Point> m_aToB;
  BasicHausdorffWitness<Point> m_bToA;
};

using SymmetricHausdorffResult = BasicSymmetricHausdorffResult<LatLon>;
using SymmetricHausdorffResult3D = BasicSymmetricHausdorffResult<LatLonAlt>;

/// Pure function of the set sizes, |sizeA| is the source set, |sizeB| is the indexed one.
HausdorffStrategy ChooseHausdorffStrategy(size_t sizeA, size_t sizeB,
                                          HausdorffParams const & params = HausdorffParams());

/// \brief max over a in |a| of min over b in |b| of distance(a, b).
/// Throws EmptyInputError if either set is empty.
/// \note The witness is the first point of |a| which attains the maximum and its
/// nearest point of |b| with the lowest index. It doesn't depend on the strategy
/// or on clipping.
HausdorffWitness DirectedHausdorff(std::vector<LatLon> const & a, std::vector<LatLon> const & b,
                                   EarthModel const & model = EarthModel::MeanSphere(),
                                   HausdorffParams const & params = HausdorffParams());

/// max(DirectedHausdorff(a, b), DirectedHausdorff(b, a)).
SymmetricHausdorffResult SymmetricHausdorff(std::vector<LatLon> const & a,
                                            std::vector<LatLon> const & b,
                                            EarthModel const & model = EarthModel::MeanSphere(),
                                            HausdorffParams const & params = HausdorffParams());

// Same as above over the points of |a| and |b| which lie in |rect|. Witness indices
// refer to the unfiltered sets. Throws EmptyInputError if nothing of a set is in |rect|.
HausdorffWitness DirectedHausdorffInRect(std::vector<LatLon> const & a,
                                         std::vector<LatLon> const & b, LatLonRect const & rect,
                                         EarthModel const & model = EarthModel::MeanSphere(),
                                         HausdorffParams const & params = HausdorffParams());
SymmetricHausdorffResult SymmetricHausdorffInRect(
    std::vector<LatLon> const & a, std::vector<LatLon> const & b, LatLonRect const & rect,
    EarthModel const & model = EarthModel::MeanSphere(),
    HausdorffParams const & params = HausdorffParams());

// Variants over points with altitudes, distances are measured with the altitude difference.
HausdorffWitness3D DirectedHausdorff(std::vector<LatLonAlt> const & a,
                                     std::vector<LatLonAlt> const & b,
                                     EarthModel const & model = EarthModel::MeanSphere(),
                                     HausdorffParams const & params = HausdorffParams());
SymmetricHausdorffResult3D SymmetricHausdorff(
    std::vector<LatLonAlt> const & a, std::vector<LatLonAlt> const & b,
    EarthModel const & model = EarthModel::MeanSphere(),
    HausdorffParams const & params = HausdorffParams());

std::string DebugPrint(HausdorffStrategy strategy);
std::string DebugPrint(HausdorffParams const & params);

template <typename Point>
std::string DebugPrint(BasicHausdorffWitness<Point> const & witness)
{
  std::ostringstream out;
  out << "HausdorffWitness [ " << witness.m_sourceIndex << ": " << DebugPrint(witness.m_source)
      << " -> " << witness.m_targetIndex << ": " << DebugPrint(witness.m_target) << ", "
      << DebugPrint(witness.m_distance) << " ]";
  return out.str();
}

template <typename Point>
std::string DebugPrint(BasicSymmetricHausdorffResult<Point> const & result)
{
  std::ostringstream out;
  out << "SymmetricHausdorffResult [ " << DebugPrint(result.m_distance)
      << ", a to b: " << DebugPrint(result.m_aToB) << ", b to a: " << DebugPrint(result.m_bToA)
      << " ]";
  return out.str();
}
}  // namespace ms
