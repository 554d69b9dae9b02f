#pragma once

#include <cstdint>
#include <exception>
#include <string>

namespace geogrid {

using ErrorCode = int32_t;

constexpr ErrorCode INFRA_SUCCESS = 0;
constexpr ErrorCode INFRA_ERROR_CODE_BASE = 40000;
constexpr ErrorCode GEO_SUCCESS = 0;
constexpr ErrorCode GEO_ERROR_CODE_BASE = 60000;

constexpr ErrorCode ToInfraErrorCode(const int32_t error_code) {
  return INFRA_ERROR_CODE_BASE + error_code;
}

constexpr ErrorCode ToGeoErrorCode(const int32_t error_code) {
  return GEO_ERROR_CODE_BASE + error_code;
}

// infra error code
constexpr ErrorCode INFRA_FILE_OPEN_ERROR = ToInfraErrorCode(2);

// geo error code
constexpr ErrorCode GEO_INVALID_COORDINATE = ToGeoErrorCode(2);
constexpr ErrorCode GEO_KEY_NOT_FOUND = ToGeoErrorCode(3);
constexpr ErrorCode GEO_EXPANSION_EXHAUSTED = ToGeoErrorCode(4);
constexpr ErrorCode GEO_INVALID_PRECISION = ToGeoErrorCode(5);
constexpr ErrorCode GEO_INVALID_RADIUS = ToGeoErrorCode(6);
constexpr ErrorCode GEO_INVALID_CELL = ToGeoErrorCode(7);
constexpr ErrorCode GEO_INVALID_CONFIG = ToGeoErrorCode(8);

namespace engine {

class GeoGridException : public std::exception {
 public:
  explicit GeoGridException(ErrorCode error_code, const std::string& message = std::string())
      : error_code_(error_code), message_(message) {
  }

  ErrorCode error_code() const {
    return error_code_;
  }

  virtual const char* what() const noexcept {
    return message_.c_str();
  }

 private:
  ErrorCode error_code_;
  std::string message_;
};

}  // namespace engine

}  // namespace geogrid
