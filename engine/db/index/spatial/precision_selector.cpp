#include "db/index/spatial/precision_selector.hpp"

#include <cmath>
#include <string>

namespace geogrid {
namespace engine {
namespace index {

namespace {

// hash length | lat bits | lng bits | lat error | lng error | km error
constexpr PrecisionTable GeohashErrors = {{
    {1, 2, 3, 23, 23, 2500},
    {2, 5, 5, 2.8, 5.6, 630},
    {3, 7, 8, 0.70, 0.7, 78},
    {4, 10, 10, 0.087, 0.18, 20},
    {5, 12, 13, 0.022, 0.022, 2.4},
    {6, 15, 15, 0.0027, 0.0055, 0.61},
    {7, 17, 18, 0.00068, 0.00068, 0.076},
    {8, 20, 20, 0.000085, 0.00017, 0.019},
}};

}  // namespace

const PrecisionTable& PrecisionSelector::Table() {
  return GeohashErrors;
}

Status PrecisionSelector::FromPrecision(int precision, PrecisionLevel& level) {
  if (precision < 1 || precision > PrecisionLevelCount) {
    return Status(GEO_INVALID_PRECISION, "precision " + std::to_string(precision) + " is outside [1, " +
                                             std::to_string(PrecisionLevelCount) + "]");
  }
  level = GeohashErrors[precision - 1];
  return Status::OK();
}

Status PrecisionSelector::FromRadius(double radius, PrecisionLevel& level) {
  if (!std::isfinite(radius) || radius < 0) {
    return Status(GEO_INVALID_RADIUS, "radius " + std::to_string(radius) + " must be finite and non-negative");
  }

  const PrecisionLevel* best = nullptr;
  bool best_below = false;
  double best_gap = 0;
  for (const auto& candidate : GeohashErrors) {
    bool below = candidate.km_error < radius;
    double gap = std::abs(radius - candidate.km_error);
    // Strict comparison keeps the first (coarsest) level on full ties.
    if (best == nullptr || below < best_below || (below == best_below && gap < best_gap)) {
      best = &candidate;
      best_below = below;
      best_gap = gap;
    }
  }
  level = *best;
  return Status::OK();
}

}  // namespace index
}  // namespace engine
}  // namespace geogrid
