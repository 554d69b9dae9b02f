#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "db/index/spatial/geo_types.hpp"

namespace geogrid {
namespace engine {
namespace index {

constexpr double EarthRadiusKm = 6371.0;

// Great-circle distance in kilometers.
double HaversineDistance(const GeoPoint& a, const GeoPoint& b);

// Resolves a candidate key to its stored point; false when unknown.
using PointLookup = std::function<bool(const std::string& key, GeoPoint& point)>;

/**
 * Appends (distance, key) for each candidate within radius of origin, in
 * candidate order. Candidates the lookup cannot resolve are dropped.
 */
void RefineWithinRadius(const GeoPoint& origin,
                        const std::vector<std::string>& candidates,
                        double radius,
                        const PointLookup& lookup,
                        std::vector<GeoCandidate>& results);

// Stable ascending sort by distance, then truncation to limit entries.
void SortByDistance(std::vector<GeoCandidate>& results, size_t limit);

}  // namespace index
}  // namespace engine
}  // namespace geogrid
