#include "db/index/spatial/frontier_expander.hpp"

#include <utility>

namespace geogrid {
namespace engine {
namespace index {

FrontierExpander::FrontierExpander(const std::string& start_cell, bool bounded, int64_t ring_limit,
                                   NeighborFunction neighbors)
    : bounded_(bounded), ring_limit_(ring_limit), neighbors_(std::move(neighbors)) {
  frontier_.push_back(start_cell);
  interior_.insert(start_cell);
}

FrontierExpander FrontierExpander::Bounded(const std::string& start_cell, int64_t ring_count,
                                           NeighborFunction neighbors) {
  return FrontierExpander(start_cell, true, ring_count, std::move(neighbors));
}

FrontierExpander FrontierExpander::Unbounded(const std::string& start_cell, int64_t max_rings,
                                             NeighborFunction neighbors) {
  return FrontierExpander(start_cell, false, max_rings, std::move(neighbors));
}

Status FrontierExpander::Next(FrontierStep& step) {
  step.cells.clear();
  step.ring = -1;

  if (next_ring_ >= ring_limit_) {
    step.kind = bounded_ ? FrontierStep::Kind::kDone : FrontierStep::Kind::kExhausted;
    return Status::OK();
  }

  if (next_ring_ > 0) {
    auto status = Advance();
    if (!status.ok()) {
      return status;
    }
    // The grid is finite: once every cell is interior no ring can add anything.
    if (!bounded_ && frontier_.empty()) {
      step.kind = FrontierStep::Kind::kExhausted;
      return Status::OK();
    }
  }

  step.kind = FrontierStep::Kind::kRing;
  step.ring = next_ring_++;
  step.cells = frontier_;
  return Status::OK();
}

Status FrontierExpander::Advance() {
  std::vector<std::string> next;
  std::vector<std::string> adjacent;
  for (const auto& cell : frontier_) {
    adjacent.clear();
    auto status = neighbors_(cell, adjacent);
    if (!status.ok()) {
      return status;
    }
    for (auto& neighbor : adjacent) {
      if (interior_.insert(neighbor).second) {
        next.push_back(std::move(neighbor));
      }
    }
  }
  frontier_ = std::move(next);
  return Status::OK();
}

}  // namespace index
}  // namespace engine
}  // namespace geogrid
