#include "config/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace geogrid;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    unsetenv("GEOGRID_MAX_FRONTIER_RINGS");
    unsetenv("GEOGRID_DEFAULT_PRECISION");
  }

  void TearDown() override {
    unsetenv("GEOGRID_MAX_FRONTIER_RINGS");
    unsetenv("GEOGRID_DEFAULT_PRECISION");
  }
};

TEST_F(ConfigTest, Defaults) {
  GridConfig config = GridConfig::FromEnv();
  EXPECT_EQ(config.precision, 5);
  EXPECT_FALSE(config.radius.has_value());
  EXPECT_TRUE(config.verbose);
  EXPECT_EQ(config.max_frontier_rings, 5000);
}

TEST_F(ConfigTest, EnvironmentVariableOverride) {
  setenv("GEOGRID_MAX_FRONTIER_RINGS", "42", 1);
  setenv("GEOGRID_DEFAULT_PRECISION", "7", 1);
  GridConfig config = GridConfig::FromEnv();
  EXPECT_EQ(config.max_frontier_rings, 42);
  EXPECT_EQ(config.precision, 7);
}

TEST_F(ConfigTest, InvalidEnvironmentFallsBackToDefault) {
  setenv("GEOGRID_MAX_FRONTIER_RINGS", "many", 1);
  EXPECT_EQ(ConfigLimits::GetMaxFrontierRings(), ConfigLimits::MAX_FRONTIER_RINGS_DEFAULT);

  setenv("GEOGRID_MAX_FRONTIER_RINGS", "0", 1);
  EXPECT_EQ(ConfigLimits::GetMaxFrontierRings(), ConfigLimits::MAX_FRONTIER_RINGS_DEFAULT);

  setenv("GEOGRID_MAX_FRONTIER_RINGS", "99999999999999", 1);
  EXPECT_EQ(ConfigLimits::GetMaxFrontierRings(), ConfigLimits::MAX_FRONTIER_RINGS_DEFAULT);

  setenv("GEOGRID_DEFAULT_PRECISION", "9", 1);
  EXPECT_EQ(ConfigLimits::GetDefaultPrecision(), ConfigLimits::PRECISION_DEFAULT);
}

TEST_F(ConfigTest, Builders) {
  GridConfig by_radius = GridConfig::WithRadius(20, false);
  ASSERT_TRUE(by_radius.radius.has_value());
  EXPECT_DOUBLE_EQ(by_radius.radius.value(), 20);
  EXPECT_FALSE(by_radius.verbose);

  GridConfig by_precision = GridConfig::WithPrecision(3);
  EXPECT_EQ(by_precision.precision, 3);
  EXPECT_FALSE(by_precision.radius.has_value());
  EXPECT_TRUE(by_precision.verbose);
}
