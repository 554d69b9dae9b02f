#include "db/index/spatial/grid_index.hpp"

#include "db/index/spatial/geohash_codec.hpp"

namespace geogrid {
namespace engine {
namespace index {

GridIndex::GridIndex(int precision) : precision_(precision) {
}

Status GridIndex::CellFor(const GeoPoint& point, std::string& cell) const {
  if (!IsValidPoint(point)) {
    return Status(GEO_INVALID_COORDINATE, "point " + ToString(point) + " is out of range");
  }
  return GeohashCodec::Encode(point, precision_, cell);
}

Status GridIndex::Insert(const std::string& key, const GeoPoint& point) {
  std::string cell;
  auto status = CellFor(point, cell);
  if (!status.ok()) {
    return status;
  }

  GridEntry& entry = entries_[key];
  entry.cell = cell;
  entry.point = point;
  buckets_[cell].push_back(key);
  return Status::OK();
}

Status GridIndex::CellOf(const std::string& key, std::string& cell) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Status(GEO_KEY_NOT_FOUND, "key '" + key + "' is not indexed");
  }
  cell = it->second.cell;
  return Status::OK();
}

Status GridIndex::PointOf(const std::string& key, GeoPoint& point) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Status(GEO_KEY_NOT_FOUND, "key '" + key + "' is not indexed");
  }
  point = it->second.point;
  return Status::OK();
}

const std::vector<std::string>& GridIndex::KeysInCell(const std::string& cell) const {
  static const std::vector<std::string> empty;
  auto it = buckets_.find(cell);
  return it == buckets_.end() ? empty : it->second;
}

void GridIndex::ForEachKeyInCells(const std::vector<std::string>& cells,
                                  const std::function<void(const std::string&)>& visit) const {
  for (const auto& cell : cells) {
    auto it = buckets_.find(cell);
    if (it == buckets_.end()) {
      continue;
    }
    for (const auto& key : it->second) {
      visit(key);
    }
  }
}

std::vector<std::string> GridIndex::KeysInCells(const std::vector<std::string>& cells) const {
  std::vector<std::string> keys;
  ForEachKeyInCells(cells, [&keys](const std::string& key) { keys.push_back(key); });
  return keys;
}

}  // namespace index
}  // namespace engine
}  // namespace geogrid
