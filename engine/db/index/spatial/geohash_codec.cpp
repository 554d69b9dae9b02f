#include "db/index/spatial/geohash_codec.hpp"

#include <algorithm>
#include <utility>

namespace geogrid {
namespace engine {
namespace index {

namespace {

constexpr char Base32Alphabet[] = "0123456789bcdefghjkmnpqrstuvwxyz";
constexpr int BitsPerChar = 5;

int Base32Value(char c) {
  const char* end = Base32Alphabet + 32;
  const char* pos = std::find(Base32Alphabet, end, c);
  return pos == end ? -1 : static_cast<int>(pos - Base32Alphabet);
}

// Longitude takes the odd share of bits when the total is odd.
inline size_t LngBits(size_t total_bits) {
  return (total_bits + 1) / 2;
}

inline size_t LatBits(size_t total_bits) {
  return total_bits / 2;
}

}  // namespace

Status GeohashCodec::Encode(const GeoPoint& point, int precision, std::string& cell) {
  if (precision < 1 || precision > MaxPrecision) {
    return Status(GEO_INVALID_PRECISION, "geohash precision " + std::to_string(precision) +
                                             " is outside [1, " + std::to_string(MaxPrecision) + "]");
  }
  if (!IsValidPoint(point)) {
    return Status(GEO_INVALID_COORDINATE, "cannot encode point " + ToString(point));
  }

  double lat_min = MinLatitude, lat_max = MaxLatitude;
  double lng_min = MinLongitude, lng_max = MaxLongitude;
  bool is_lng = true;

  cell.clear();
  cell.reserve(precision);
  int value = 0;
  int bit = 0;
  while (static_cast<int>(cell.size()) < precision) {
    value <<= 1;
    if (is_lng) {
      double mid = lng_min + (lng_max - lng_min) / 2.0;
      if (point.longitude > mid) {
        value |= 1;
        lng_min = mid;
      } else {
        lng_max = mid;
      }
    } else {
      double mid = lat_min + (lat_max - lat_min) / 2.0;
      if (point.latitude > mid) {
        value |= 1;
        lat_min = mid;
      } else {
        lat_max = mid;
      }
    }
    is_lng = !is_lng;

    if (++bit == BitsPerChar) {
      cell.push_back(Base32Alphabet[value]);
      value = 0;
      bit = 0;
    }
  }
  return Status::OK();
}

Status GeohashCodec::Neighbors(const std::string& cell, std::vector<std::string>& neighbors) {
  uint64_t lat_index = 0;
  uint64_t lng_index = 0;
  auto status = ToIndices(cell, lat_index, lng_index);
  if (!status.ok()) {
    return status;
  }

  const size_t total_bits = cell.size() * BitsPerChar;
  const int64_t rows = int64_t{1} << LatBits(total_bits);
  const int64_t cols = int64_t{1} << LngBits(total_bits);

  static const int moves[8][2] = {
      {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};

  neighbors.clear();
  neighbors.reserve(8);
  for (const auto& move : moves) {
    int64_t row = static_cast<int64_t>(lat_index) + move[0];
    if (row < 0 || row >= rows) {
      continue;
    }
    int64_t col = (static_cast<int64_t>(lng_index) + move[1] + cols) % cols;
    std::string neighbor = FromIndices(row, col, cell.size());
    if (neighbor != cell &&
        std::find(neighbors.begin(), neighbors.end(), neighbor) == neighbors.end()) {
      neighbors.push_back(std::move(neighbor));
    }
  }
  return Status::OK();
}

Status GeohashCodec::ToIndices(const std::string& cell, uint64_t& lat_index, uint64_t& lng_index) {
  if (cell.empty() || cell.size() > static_cast<size_t>(MaxPrecision)) {
    return Status(GEO_INVALID_CELL, "geohash cell '" + cell + "' has an invalid length");
  }

  lat_index = 0;
  lng_index = 0;
  bool is_lng = true;
  for (char c : cell) {
    int value = Base32Value(c);
    if (value < 0) {
      return Status(GEO_INVALID_CELL, "geohash cell '" + cell + "' contains invalid character");
    }
    for (int shift = BitsPerChar - 1; shift >= 0; --shift) {
      uint64_t bit = (value >> shift) & 1;
      if (is_lng) {
        lng_index = (lng_index << 1) | bit;
      } else {
        lat_index = (lat_index << 1) | bit;
      }
      is_lng = !is_lng;
    }
  }
  return Status::OK();
}

std::string GeohashCodec::FromIndices(uint64_t lat_index, uint64_t lng_index, size_t precision) {
  const size_t total_bits = precision * BitsPerChar;
  size_t lng_shift = LngBits(total_bits);
  size_t lat_shift = LatBits(total_bits);

  std::string cell;
  cell.reserve(precision);
  int value = 0;
  int bit = 0;
  for (size_t i = 0; i < total_bits; ++i) {
    value <<= 1;
    if (i % 2 == 0) {
      value |= static_cast<int>((lng_index >> --lng_shift) & 1);
    } else {
      value |= static_cast<int>((lat_index >> --lat_shift) & 1);
    }
    if (++bit == BitsPerChar) {
      cell.push_back(Base32Alphabet[value]);
      value = 0;
      bit = 0;
    }
  }
  return cell;
}

}  // namespace index
}  // namespace engine
}  // namespace geogrid
