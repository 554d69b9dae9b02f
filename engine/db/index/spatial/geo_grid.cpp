#include "db/index/spatial/geo_grid.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <utility>

#include "db/index/spatial/frontier_expander.hpp"
#include "db/index/spatial/geo_distance.hpp"
#include "db/index/spatial/geohash_codec.hpp"

namespace geogrid {
namespace engine {
namespace index {

PrecisionLevel GeoGrid::ResolveLevel(const GridConfig& config) {
  PrecisionLevel level{};
  auto status = config.radius.has_value() ? PrecisionSelector::FromRadius(config.radius.value(), level)
                                          : PrecisionSelector::FromPrecision(config.precision, level);
  if (!status.ok()) {
    throw GeoGridException(status.code(), status.message());
  }
  if (config.max_frontier_rings < ConfigLimits::MAX_FRONTIER_RINGS_MIN) {
    throw GeoGridException(GEO_INVALID_CONFIG, "max frontier rings " + std::to_string(config.max_frontier_rings) +
                                                   " must be at least " +
                                                   std::to_string(ConfigLimits::MAX_FRONTIER_RINGS_MIN));
  }
  return level;
}

GeoGrid::GeoGrid(const GridConfig& config)
    : level_(ResolveLevel(config)),
      max_frontier_rings_(config.max_frontier_rings),
      verbose_(config.verbose),
      index_(level_.precision) {
  if (verbose_) {
    std::ostringstream msg;
    msg << "Setting grid precision to " << level_.precision << ", avg radius to " << level_.km_error << "km";
    logger_.Info(msg.str());
  }
}

Status GeoGrid::Insert(const std::string& key, const GeoPoint& point) {
  auto status = index_.Insert(key, point);
  if (!status.ok() && verbose_) {
    logger_.Warning("Wrong coordinates " + ToString(point) + " for key " + key + ", skipping point.");
  }
  return status;
}

Status GeoGrid::RingCountForRadius(double radius, int64_t& rings) const {
  if (!std::isfinite(radius) || radius < 0) {
    return Status(GEO_INVALID_RADIUS, "radius " + std::to_string(radius) + " must be finite and non-negative");
  }
  if (radius == level_.km_error) {
    rings = 2;
    return Status::OK();
  }
  // Past the int32 range the rings cover the whole grid anyway.
  double count = std::min(std::floor(radius / level_.km_error),
                          static_cast<double>(std::numeric_limits<int32_t>::max()));
  rings = static_cast<int64_t>(count) + 2;
  return Status::OK();
}

Status GeoGrid::FindNearCell(const std::string& cell,
                             const GeoPoint& origin,
                             double radius,
                             bool double_check,
                             std::vector<GeoCandidate>& results) const {
  int64_t ring_count = 0;
  auto ring_status = RingCountForRadius(radius, ring_count);
  if (!ring_status.ok()) {
    return ring_status;
  }

  std::vector<std::string> candidates;
  auto expander = FrontierExpander::Bounded(cell, ring_count, GeohashCodec::Neighbors);
  FrontierStep step;
  while (true) {
    auto status = expander.Next(step);
    if (!status.ok()) {
      return status;
    }
    // Rings after an empty one are empty as well.
    if (step.kind != FrontierStep::Kind::kRing || (step.ring > 0 && step.cells.empty())) {
      break;
    }
    index_.ForEachKeyInCells(step.cells, [&candidates](const std::string& key) { candidates.push_back(key); });
  }

  if (double_check) {
    RefineWithinRadius(origin, candidates, radius,
                       [this](const std::string& key, GeoPoint& point) { return LookupPoint(key, point); },
                       results);
  } else {
    results.reserve(candidates.size());
    for (auto& key : candidates) {
      results.emplace_back(0, std::move(key));
    }
  }
  return Status::OK();
}

Status GeoGrid::FindNearPoint(const std::optional<GeoPoint>& point,
                              double radius,
                              bool double_check,
                              std::vector<GeoCandidate>& results) const {
  results.clear();
  if (!point.has_value()) {
    return Status::OK();
  }

  std::string cell;
  auto status = index_.CellFor(point.value(), cell);
  if (!status.ok()) {
    return status;
  }
  return FindNearCell(cell, point.value(), radius, double_check, results);
}

Status GeoGrid::FindNearKey(const std::string& key,
                            double radius,
                            bool double_check,
                            std::vector<GeoCandidate>& results) const {
  results.clear();
  std::string cell;
  GeoPoint origin;
  if (!index_.CellOf(key, cell).ok() || !index_.PointOf(key, origin).ok()) {
    // Keys without a usable geocode were never indexed.
    return Status::OK();
  }
  return FindNearCell(cell, origin, radius, double_check, results);
}

Status GeoGrid::FindClosestFromPoint(const GeoPoint& point,
                                     size_t n,
                                     bool double_check,
                                     const std::optional<std::unordered_set<std::string>>& restrict_to,
                                     std::vector<GeoCandidate>& results) const {
  results.clear();
  // An empty restriction would never satisfy the stop condition.
  if (restrict_to.has_value() && restrict_to->empty()) {
    return Status::OK();
  }

  n = std::min(n, index_.Size());

  std::string cell;
  auto status = index_.CellFor(point, cell);
  if (!status.ok()) {
    return status;
  }

  std::vector<std::string> found;
  std::unordered_set<std::string> seen;
  auto collect = [&](const std::string& key) {
    if (restrict_to.has_value() && restrict_to->find(key) == restrict_to->end()) {
      return;
    }
    if (seen.insert(key).second) {
      found.push_back(key);
    }
  };

  auto expander = FrontierExpander::Unbounded(cell, max_frontier_rings_, GeohashCodec::Neighbors);
  FrontierStep step;
  while (true) {
    status = expander.Next(step);
    if (!status.ok()) {
      return status;
    }
    if (step.kind != FrontierStep::Kind::kRing) {
      std::string msg = "found " + std::to_string(found.size()) + " of " + std::to_string(n) +
                        " keys after " + std::to_string(expander.RingsEmitted()) + " rings around " + cell;
      logger_.Warning("Frontier expansion exhausted: " + msg);
      return Status(GEO_EXPANSION_EXHAUSTED, msg);
    }

    index_.ForEachKeyInCells(step.cells, collect);

    // A single-cell ring is not a complete boundary yet.
    if (found.size() >= n && step.cells.size() > 1) {
      break;
    }
  }

  if (double_check) {
    RefineWithinRadius(point, found, std::numeric_limits<double>::infinity(),
                       [this](const std::string& key, GeoPoint& p) { return LookupPoint(key, p); },
                       results);
    SortByDistance(results, n);
  } else {
    results.reserve(found.size());
    for (auto& key : found) {
      results.emplace_back(0, std::move(key));
    }
  }
  return Status::OK();
}

}  // namespace index
}  // namespace engine
}  // namespace geogrid
