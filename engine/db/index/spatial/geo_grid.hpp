#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "config/config.hpp"
#include "db/index/spatial/geo_types.hpp"
#include "db/index/spatial/grid_index.hpp"
#include "db/index/spatial/precision_selector.hpp"
#include "logger/logger.hpp"
#include "utils/status.hpp"

namespace geogrid {
namespace engine {
namespace index {

/**
 * @brief Geohash grid answering proximity queries over keyed points.
 *
 * Results are approximate unless double_check is set, in which case exact
 * haversine distances filter (radius queries) or rank (closest queries) the
 * grid candidates. Without double_check every distance is reported as 0 and
 * the order is cell order then insertion order.
 *
 * Every query recomputes its candidates, so repeating a query without
 * intervening inserts gives the same results. The grid is not synchronized:
 * callers mixing inserts with concurrent queries need their own
 * reader-writer lock around it.
 */
class GeoGrid {
 public:
  // Throws GeoGridException on an invalid precision or radius.
  explicit GeoGrid(const GridConfig& config);

  // Invalid coordinates are skipped (and logged when verbose).
  Status Insert(const std::string& key, const GeoPoint& point);

  // Empty result for a missing point.
  Status FindNearPoint(const std::optional<GeoPoint>& point,
                       double radius,
                       bool double_check,
                       std::vector<GeoCandidate>& results) const;

  // Empty result for a key that was never indexed.
  Status FindNearKey(const std::string& key,
                     double radius,
                     bool double_check,
                     std::vector<GeoCandidate>& results) const;

  /**
   * Grows rings around the point until at least n keys (n clamped to the
   * index size) were found and the last ring had more than one cell. When
   * restrict_to is set, only its keys count; an empty set returns at once.
   * With double_check the n nearest found keys come back sorted by distance,
   * ties in discovery order. Returns GEO_EXPANSION_EXHAUSTED when the rings
   * run out before n keys were found.
   */
  Status FindClosestFromPoint(const GeoPoint& point,
                              size_t n,
                              bool double_check,
                              const std::optional<std::unordered_set<std::string>>& restrict_to,
                              std::vector<GeoCandidate>& results) const;

  // floor(radius / average error) + 2, or 2 when radius is exactly the error.
  // GEO_INVALID_RADIUS for a negative or non-finite radius.
  Status RingCountForRadius(double radius, int64_t& rings) const;

  int Precision() const {
    return level_.precision;
  }

  double AverageRadius() const {
    return level_.km_error;
  }

  const GridIndex& Index() const {
    return index_;
  }

  size_t Size() const {
    return index_.Size();
  }

 private:
  static PrecisionLevel ResolveLevel(const GridConfig& config);

  Status FindNearCell(const std::string& cell,
                      const GeoPoint& origin,
                      double radius,
                      bool double_check,
                      std::vector<GeoCandidate>& results) const;

  bool LookupPoint(const std::string& key, GeoPoint& point) const {
    return index_.PointOf(key, point).ok();
  }

  const PrecisionLevel level_;
  const int64_t max_frontier_rings_;
  const bool verbose_;
  GridIndex index_;
  mutable Logger logger_;
};

}  // namespace index
}  // namespace engine
}  // namespace geogrid
