#include "db/index/spatial/geo_distance.hpp"

#include <algorithm>
#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>

namespace geogrid {
namespace engine {
namespace index {

namespace bg = boost::geometry;

namespace {

// spherical_equatorial points are (longitude, latitude).
typedef bg::model::point<double, 2, bg::cs::spherical_equatorial<bg::degree>> sphere_point_t;

}  // namespace

double HaversineDistance(const GeoPoint& a, const GeoPoint& b) {
  static const bg::strategy::distance::haversine<double> strategy(EarthRadiusKm);
  return bg::distance(sphere_point_t(a.longitude, a.latitude),
                      sphere_point_t(b.longitude, b.latitude),
                      strategy);
}

void RefineWithinRadius(const GeoPoint& origin,
                        const std::vector<std::string>& candidates,
                        double radius,
                        const PointLookup& lookup,
                        std::vector<GeoCandidate>& results) {
  GeoPoint point;
  for (const auto& key : candidates) {
    if (!lookup(key, point)) {
      continue;
    }
    double dist = HaversineDistance(origin, point);
    if (dist <= radius) {
      results.emplace_back(dist, key);
    }
  }
}

void SortByDistance(std::vector<GeoCandidate>& results, size_t limit) {
  std::stable_sort(results.begin(), results.end(),
                   [](const GeoCandidate& a, const GeoCandidate& b) { return a.distance < b.distance; });
  if (results.size() > limit) {
    results.resize(limit);
  }
}

}  // namespace index
}  // namespace engine
}  // namespace geogrid
