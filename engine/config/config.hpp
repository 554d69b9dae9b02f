#pragma once

#include <cerrno>   // Include for errno
#include <climits>  // Include for INT_MAX, INT_MIN
#include <cstdio>
#include <cstdlib>  // Include for std::getenv and std::strtol
#include <optional>
#include <string>

namespace geogrid {

// ============================================================================
// Configuration Limits and Defaults
// All limits can be overridden via GEOGRID_* environment variables
// ============================================================================

struct ConfigLimits {
  // Grid precision, as a geohash length
  static constexpr int PRECISION_DEFAULT = 5;
  static constexpr int PRECISION_MIN = 1;
  static constexpr int PRECISION_MAX = 8;

  // Hard cap on rings emitted by an open-ended frontier expansion
  static constexpr int MAX_FRONTIER_RINGS_DEFAULT = 5000;
  static constexpr int MAX_FRONTIER_RINGS_MIN = 1;
  static constexpr int MAX_FRONTIER_RINGS_MAX = 100000;

  // Helper function to get limit from environment or use default
  static int GetEnvInt(const char* env_name, int default_value, int min_value, int max_value) {
    const char* env_value = std::getenv(env_name);
    if (env_value != nullptr) {
      // strtol instead of atoi: atoi wraps silently on overflow
      char* end;
      errno = 0;
      long value_long = std::strtol(env_value, &end, 10);

      if (errno == ERANGE || value_long > INT_MAX || value_long < INT_MIN) {
        printf("[ConfigLimits] Warning: %s=%s out of range (overflow), using default %d\n",
               env_name, env_value, default_value);
        return default_value;
      }

      if (end == env_value || *end != '\0') {
        printf("[ConfigLimits] Warning: %s=%s invalid integer, using default %d\n",
               env_name, env_value, default_value);
        return default_value;
      }

      int value = static_cast<int>(value_long);
      if (value >= min_value && value <= max_value) {
        return value;
      }
      printf("[ConfigLimits] Warning: %s=%s out of range [%d, %d], using default %d\n",
             env_name, env_value, min_value, max_value, default_value);
    }
    return default_value;
  }

  static int GetDefaultPrecision() {
    return GetEnvInt("GEOGRID_DEFAULT_PRECISION", PRECISION_DEFAULT, PRECISION_MIN, PRECISION_MAX);
  }

  static int GetMaxFrontierRings() {
    return GetEnvInt("GEOGRID_MAX_FRONTIER_RINGS", MAX_FRONTIER_RINGS_DEFAULT,
                     MAX_FRONTIER_RINGS_MIN, MAX_FRONTIER_RINGS_MAX);
  }
};

/**
 * @brief Construction parameters of a GeoGrid.
 *
 * Exactly one of precision and radius drives the grid resolution: when radius
 * is set, the precision is selected from it and the precision field is ignored.
 */
struct GridConfig {
  int precision = ConfigLimits::PRECISION_DEFAULT;
  std::optional<double> radius;
  bool verbose = true;
  int max_frontier_rings = ConfigLimits::MAX_FRONTIER_RINGS_DEFAULT;

  static GridConfig FromEnv() {
    GridConfig config;
    config.precision = ConfigLimits::GetDefaultPrecision();
    config.max_frontier_rings = ConfigLimits::GetMaxFrontierRings();
    return config;
  }

  static GridConfig WithPrecision(int precision, bool verbose = true) {
    GridConfig config = FromEnv();
    config.precision = precision;
    config.verbose = verbose;
    return config;
  }

  static GridConfig WithRadius(double radius, bool verbose = true) {
    GridConfig config = FromEnv();
    config.radius = radius;
    config.verbose = verbose;
    return config;
  }
};

}  // namespace geogrid
