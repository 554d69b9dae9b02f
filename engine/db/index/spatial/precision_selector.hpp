#pragma once

#include <array>

#include "utils/status.hpp"

namespace geogrid {
namespace engine {
namespace index {

// Resolution of one geohash length. km_error is the average cell error used
// as the grid's "average radius" when converting a radius into rings.
struct PrecisionLevel {
  int precision;
  int lat_bits;
  int lng_bits;
  double lat_error;
  double lng_error;
  double km_error;
};

constexpr int PrecisionLevelCount = 8;

using PrecisionTable = std::array<PrecisionLevel, PrecisionLevelCount>;

class PrecisionSelector {
 public:
  static const PrecisionTable& Table();

  static Status FromPrecision(int precision, PrecisionLevel& level);

  /**
   * Picks the level minimizing (km_error < radius, |radius - km_error|), false
   * ordered before true. The coarsest level whose error still covers the
   * radius wins; closeness alone only decides once every level is finer than
   * the radius.
   */
  static Status FromRadius(double radius, PrecisionLevel& level);
};

}  // namespace index
}  // namespace engine
}  // namespace geogrid
