#include "db/index/spatial/geohash_codec.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using geogrid::engine::index::GeohashCodec;
using geogrid::engine::index::GeoPoint;

TEST(GeohashCodec, EncodeKnownCells) {
  std::string cell;
  ASSERT_TRUE(GeohashCodec::Encode(GeoPoint(48.72, 2.359), 4, cell).ok());
  EXPECT_EQ(cell, "u09t");
  ASSERT_TRUE(GeohashCodec::Encode(GeoPoint(48.75, 2.361), 4, cell).ok());
  EXPECT_EQ(cell, "u09t");
  ASSERT_TRUE(GeohashCodec::Encode(GeoPoint(48.72, 2.359), 1, cell).ok());
  EXPECT_EQ(cell, "u");
}

TEST(GeohashCodec, EncodeLengthMatchesPrecision) {
  std::string cell;
  for (int precision = 1; precision <= GeohashCodec::MaxPrecision; ++precision) {
    ASSERT_TRUE(GeohashCodec::Encode(GeoPoint(-33.8688, 151.2093), precision, cell).ok());
    EXPECT_EQ(cell.size(), static_cast<size_t>(precision));
  }
}

TEST(GeohashCodec, EncodeRejectsBadInput) {
  std::string cell;
  auto status = GeohashCodec::Encode(GeoPoint(91, 0), 4, cell);
  EXPECT_EQ(status.code(), geogrid::GEO_INVALID_COORDINATE);
  status = GeohashCodec::Encode(GeoPoint(0, -180.5), 4, cell);
  EXPECT_EQ(status.code(), geogrid::GEO_INVALID_COORDINATE);
  status = GeohashCodec::Encode(GeoPoint(0, 0), 0, cell);
  EXPECT_EQ(status.code(), geogrid::GEO_INVALID_PRECISION);
  status = GeohashCodec::Encode(GeoPoint(0, 0), GeohashCodec::MaxPrecision + 1, cell);
  EXPECT_EQ(status.code(), geogrid::GEO_INVALID_PRECISION);
}

TEST(GeohashCodec, NeighborsOfInteriorCell) {
  std::vector<std::string> neighbors;
  ASSERT_TRUE(GeohashCodec::Neighbors("t0db", neighbors).ok());
  std::sort(neighbors.begin(), neighbors.end());
  std::vector<std::string> expected = {"t06x", "t06z", "t07p", "t0d8", "t0d9", "t0dc", "t0e0", "t0e1"};
  EXPECT_EQ(neighbors, expected);
}

TEST(GeohashCodec, NeighborsStopAtPoles) {
  std::vector<std::string> neighbors;
  // "u" sits in the top row of the precision 1 grid.
  ASSERT_TRUE(GeohashCodec::Neighbors("u", neighbors).ok());
  EXPECT_EQ(neighbors.size(), 5u);
  for (const auto& neighbor : neighbors) {
    EXPECT_EQ(neighbor.size(), 1u);
  }
}

TEST(GeohashCodec, NeighborsWrapAntimeridian) {
  std::vector<std::string> neighbors;
  // "0" is the south-west corner cell: its western neighbors are on the far east side.
  ASSERT_TRUE(GeohashCodec::Neighbors("0", neighbors).ok());
  EXPECT_EQ(neighbors.size(), 5u);
  EXPECT_NE(std::find(neighbors.begin(), neighbors.end(), "p"), neighbors.end());
  EXPECT_NE(std::find(neighbors.begin(), neighbors.end(), "r"), neighbors.end());
}

TEST(GeohashCodec, NeighborsRejectInvalidCell) {
  std::vector<std::string> neighbors;
  EXPECT_EQ(GeohashCodec::Neighbors("", neighbors).code(), geogrid::GEO_INVALID_CELL);
  EXPECT_EQ(GeohashCodec::Neighbors("u0a", neighbors).code(), geogrid::GEO_INVALID_CELL);
  EXPECT_EQ(GeohashCodec::Neighbors("u09tu09tu09tu", neighbors).code(), geogrid::GEO_INVALID_CELL);
}
