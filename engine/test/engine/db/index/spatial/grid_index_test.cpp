#include "db/index/spatial/grid_index.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

#include "db/index/spatial/geohash_codec.hpp"

using geogrid::engine::index::GeohashCodec;
using geogrid::engine::index::GeoPoint;
using geogrid::engine::index::GridIndex;

class GridIndexTest : public ::testing::Test {
 protected:
  GridIndex index_{4};
};

TEST_F(GridIndexTest, InsertStoresEntryAndBucket) {
  ASSERT_TRUE(index_.Insert("ORY", GeoPoint(48.72, 2.359)).ok());
  ASSERT_TRUE(index_.Insert("CDG", GeoPoint(48.75, 2.361)).ok());

  std::string cell;
  ASSERT_TRUE(index_.CellOf("ORY", cell).ok());
  EXPECT_EQ(cell, "u09t");

  GeoPoint point;
  ASSERT_TRUE(index_.PointOf("CDG", point).ok());
  EXPECT_EQ(point, GeoPoint(48.75, 2.361));

  std::vector<std::string> expected = {"ORY", "CDG"};
  EXPECT_EQ(index_.KeysInCell("u09t"), expected);
  EXPECT_EQ(index_.Size(), 2u);
  EXPECT_EQ(index_.CellCount(), 1u);
}

TEST_F(GridIndexTest, CellOfMatchesEncoder) {
  std::vector<GeoPoint> points = {
      {48.72, 2.359}, {-33.8688, 151.2093}, {40.7128, -74.006}, {90, 180}, {-90, -180}, {0, 0}};
  for (size_t i = 0; i < points.size(); ++i) {
    std::string key = "k" + std::to_string(i);
    ASSERT_TRUE(index_.Insert(key, points[i]).ok());

    std::string cell, expected;
    ASSERT_TRUE(index_.CellOf(key, cell).ok());
    ASSERT_TRUE(GeohashCodec::Encode(points[i], 4, expected).ok());
    EXPECT_EQ(cell, expected);
    EXPECT_EQ(cell.size(), 4u);
  }
}

TEST_F(GridIndexTest, InvalidCoordinatesAreSkipped) {
  ASSERT_TRUE(index_.Insert("ORY", GeoPoint(48.72, 2.359)).ok());

  EXPECT_TRUE(index_.Insert("BAD1", GeoPoint(90.5, 0)).IsInvalidCoordinate());
  EXPECT_TRUE(index_.Insert("BAD2", GeoPoint(0, 181)).IsInvalidCoordinate());
  EXPECT_TRUE(index_.Insert("BAD3", GeoPoint(std::nan(""), 0)).IsInvalidCoordinate());
  EXPECT_TRUE(index_.Insert("ORY", GeoPoint(0, INFINITY)).IsInvalidCoordinate());

  EXPECT_EQ(index_.Size(), 1u);
  EXPECT_EQ(index_.CellCount(), 1u);
  EXPECT_FALSE(index_.Contains("BAD1"));

  // The failed re-insert left the earlier entry alone.
  GeoPoint point;
  ASSERT_TRUE(index_.PointOf("ORY", point).ok());
  EXPECT_EQ(point, GeoPoint(48.72, 2.359));
}

TEST_F(GridIndexTest, UnknownKeyIsNotFound) {
  std::string cell;
  GeoPoint point;
  EXPECT_TRUE(index_.CellOf("nope", cell).IsKeyNotFound());
  EXPECT_TRUE(index_.PointOf("nope", point).IsKeyNotFound());
  EXPECT_TRUE(index_.KeysInCell("u09t").empty());
}

TEST_F(GridIndexTest, ReinsertKeepsEarlierBucketSlot) {
  ASSERT_TRUE(index_.Insert("A", GeoPoint(48.72, 2.359)).ok());
  ASSERT_TRUE(index_.Insert("A", GeoPoint(48.72, 2.359)).ok());
  ASSERT_TRUE(index_.Insert("A", GeoPoint(-33.8688, 151.2093)).ok());

  std::string cell;
  ASSERT_TRUE(index_.CellOf("A", cell).ok());
  EXPECT_NE(cell, "u09t");

  std::vector<std::string> duplicated = {"A", "A"};
  EXPECT_EQ(index_.KeysInCell("u09t"), duplicated);
  EXPECT_EQ(index_.KeysInCell(cell), std::vector<std::string>{"A"});
  EXPECT_EQ(index_.Size(), 1u);
}

TEST_F(GridIndexTest, KeysInCellsFollowCellThenBucketOrder) {
  ASSERT_TRUE(index_.Insert("ORY", GeoPoint(48.72, 2.359)).ok());
  ASSERT_TRUE(index_.Insert("SYD", GeoPoint(-33.8688, 151.2093)).ok());
  ASSERT_TRUE(index_.Insert("CDG", GeoPoint(48.75, 2.361)).ok());

  std::string sydney;
  ASSERT_TRUE(index_.CellOf("SYD", sydney).ok());

  std::vector<std::string> expected = {"SYD", "ORY", "CDG"};
  EXPECT_EQ(index_.KeysInCells({sydney, "zzzz", "u09t"}), expected);

  std::vector<std::string> visited;
  index_.ForEachKeyInCells({"u09t"}, [&visited](const std::string& key) { visited.push_back(key); });
  EXPECT_EQ(visited, (std::vector<std::string>{"ORY", "CDG"}));
}
