#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

#include "utils/status.hpp"

namespace geogrid {
namespace engine {
namespace index {

// Appends the cells adjacent to cell; neighbors arrives empty.
using NeighborFunction = std::function<Status(const std::string& cell, std::vector<std::string>& neighbors)>;

struct FrontierStep {
  enum class Kind {
    kRing,       // cells holds ring number ring
    kDone,       // bounded expansion emitted every requested ring
    kExhausted,  // open-ended expansion hit its cap or ran out of cells
  };

  Kind kind = Kind::kDone;
  int64_t ring = -1;
  std::vector<std::string> cells;
};

/**
 * @brief Concentric rings of cells around a start cell.
 *
 * Ring 0 is the start cell. Ring i holds the neighbors of ring i-1 that no
 * earlier ring emitted. Bounded expansion stops after a fixed ring count;
 * open-ended expansion stops at max_rings and reports kExhausted. Cells inside
 * a ring keep neighbor discovery order.
 */
class FrontierExpander {
 public:
  static FrontierExpander Bounded(const std::string& start_cell, int64_t ring_count,
                                  NeighborFunction neighbors);

  static FrontierExpander Unbounded(const std::string& start_cell, int64_t max_rings,
                                    NeighborFunction neighbors);

  Status Next(FrontierStep& step);

  const std::unordered_set<std::string>& Interior() const {
    return interior_;
  }

  int64_t RingsEmitted() const {
    return next_ring_;
  }

 private:
  FrontierExpander(const std::string& start_cell, bool bounded, int64_t ring_limit,
                   NeighborFunction neighbors);

  Status Advance();

  const bool bounded_;
  const int64_t ring_limit_;
  NeighborFunction neighbors_;

  std::unordered_set<std::string> interior_;
  std::vector<std::string> frontier_;
  int64_t next_ring_ = 0;
};

}  // namespace index
}  // namespace engine
}  // namespace geogrid
