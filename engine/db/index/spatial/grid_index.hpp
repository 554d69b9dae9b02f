#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "db/index/spatial/geo_types.hpp"
#include "utils/status.hpp"

namespace geogrid {
namespace engine {
namespace index {

struct GridEntry {
  std::string cell;
  GeoPoint point;
};

/**
 * @brief Key -> (cell, point) entries and cell -> key buckets, kept in step.
 *
 * Insert is the only mutation. Re-inserting a key overwrites its entry and
 * appends it to the new cell's bucket again; earlier bucket slots are kept.
 * Not synchronized: build first, then query.
 */
class GridIndex {
 public:
  explicit GridIndex(int precision);

  // GEO_INVALID_COORDINATE leaves the index untouched.
  Status Insert(const std::string& key, const GeoPoint& point);

  Status CellOf(const std::string& key, std::string& cell) const;

  Status PointOf(const std::string& key, GeoPoint& point) const;

  bool Contains(const std::string& key) const {
    return entries_.find(key) != entries_.end();
  }

  const std::vector<std::string>& KeysInCell(const std::string& cell) const;

  // Keys of every cell in order, each bucket in insertion order.
  std::vector<std::string> KeysInCells(const std::vector<std::string>& cells) const;

  void ForEachKeyInCells(const std::vector<std::string>& cells,
                         const std::function<void(const std::string&)>& visit) const;

  Status CellFor(const GeoPoint& point, std::string& cell) const;

  int Precision() const {
    return precision_;
  }

  // Distinct keys.
  size_t Size() const {
    return entries_.size();
  }

  size_t CellCount() const {
    return buckets_.size();
  }

 private:
  const int precision_;
  std::unordered_map<std::string, GridEntry> entries_;
  std::unordered_map<std::string, std::vector<std::string>> buckets_;
};

}  // namespace index
}  // namespace engine
}  // namespace geogrid
