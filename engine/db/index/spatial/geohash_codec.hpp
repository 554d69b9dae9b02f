#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "db/index/spatial/geo_types.hpp"
#include "utils/status.hpp"

namespace geogrid {
namespace engine {
namespace index {

/**
 * @brief Base32 geohash cells.
 *
 * A cell of length P carries 5*P interleaved bits, longitude first. Cells are
 * addressed internally as a (latitude row, longitude column) pair so that
 * adjacency is a +/-1 move on either axis. Columns wrap around the
 * antimeridian, rows stop at the poles.
 */
class GeohashCodec {
 public:
  static constexpr int MaxPrecision = 12;

  static Status Encode(const GeoPoint& point, int precision, std::string& cell);

  // Up to 8 cells sharing an edge or a corner with the given cell, same length.
  static Status Neighbors(const std::string& cell, std::vector<std::string>& neighbors);

 private:
  static Status ToIndices(const std::string& cell, uint64_t& lat_index, uint64_t& lng_index);

  static std::string FromIndices(uint64_t lat_index, uint64_t lng_index, size_t precision);
};

}  // namespace index
}  // namespace engine
}  // namespace geogrid
