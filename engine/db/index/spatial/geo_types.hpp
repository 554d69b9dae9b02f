#pragma once

#include <cmath>
#include <string>
#include <utility>

namespace geogrid {
namespace engine {
namespace index {

constexpr double MinLatitude = -90.0;
constexpr double MaxLatitude = 90.0;
constexpr double MinLongitude = -180.0;
constexpr double MaxLongitude = 180.0;

struct GeoPoint {
  double latitude = 0;
  double longitude = 0;

  GeoPoint() = default;
  GeoPoint(double lat, double lng) : latitude(lat), longitude(lng) {}

  bool operator==(const GeoPoint& other) const {
    return latitude == other.latitude && longitude == other.longitude;
  }
};

// Both coordinates finite and inside the WGS84 degree ranges.
inline bool IsValidPoint(const GeoPoint& point) {
  return std::isfinite(point.latitude) && std::isfinite(point.longitude) &&
         point.latitude >= MinLatitude && point.latitude <= MaxLatitude &&
         point.longitude >= MinLongitude && point.longitude <= MaxLongitude;
}

inline std::string ToString(const GeoPoint& point) {
  return "(" + std::to_string(point.latitude) + ", " + std::to_string(point.longitude) + ")";
}

// One query result. distance is 0 unless the query refined candidates.
struct GeoCandidate {
  double distance = 0;
  std::string key;

  GeoCandidate() = default;
  GeoCandidate(double dist, std::string k) : distance(dist), key(std::move(k)) {}

  bool operator==(const GeoCandidate& other) const {
    return distance == other.distance && key == other.key;
  }
};

}  // namespace index
}  // namespace engine
}  // namespace geogrid
