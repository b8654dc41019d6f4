#include "parkwise/alloc/OccupancyGrid.h"

#include "parkwise/core/Assert.h"
#include "parkwise/core/Hash.h"
#include "parkwise/core/Log.h"
#include "parkwise/core/Random.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <string>

namespace parkwise::alloc {

static std::string cellText(int bay, int slot) {
  std::ostringstream oss;
  oss << "(" << bay << "," << slot << ")";
  return oss.str();
}

OccupancyGrid::OccupancyGrid(const Facility& facility) : facility_(facility) {
  PARKWISE_ASSERT_MSG(facility_.valid(), "OccupancyGrid: facility needs >= 1 bay and >= 1 slot per bay");
  cells_.resize(static_cast<std::size_t>(facility_.capacity()));
}

void OccupancyGrid::reset(double initialFillRatio, core::u64 seed) {
  if (!(initialFillRatio >= 0.0 && initialFillRatio <= 1.0)) {
    std::ostringstream oss;
    oss << "OccupancyGrid::reset: fill ratio " << initialFillRatio << " clamped to [0,1]";
    PARKWISE_LOG_WARN(oss.str());
    initialFillRatio = std::isnan(initialFillRatio) ? 0.0 : std::clamp(initialFillRatio, 0.0, 1.0);
  }

  for (auto& c : cells_) c.reset();
  occupied_ = 0;

  const int capacity = facility_.capacity();
  const int target = static_cast<int>(std::lround(initialFillRatio * capacity));
  if (target <= 0) {
    PARKWISE_LOG_DEBUG("OccupancyGrid::reset: empty grid");
    return;
  }

  // Partial Fisher-Yates over action ids: the first `target` entries are the
  // pre-occupied cells.
  std::vector<int> order(static_cast<std::size_t>(capacity));
  std::iota(order.begin(), order.end(), 0);
  core::SplitMix64 rng(core::hashCombine(seed, core::fnv1a64("OccupancyGrid.prefill")));
  for (int i = 0; i < target; ++i) {
    const int j = i + static_cast<int>(rng.nextIndex(static_cast<std::size_t>(capacity - i)));
    std::swap(order[i], order[j]);
  }

  for (int i = 0; i < target; ++i) {
    Reservation r;
    r.vehicleId = "prefill-" + std::to_string(i);
    r.arrivalTime = kPrefillArrival;
    r.departureTime = kPrefillDeparture;
    r.priorityLevel = 0;
    cells_[order[i]] = std::move(r);
  }
  occupied_ = target;

  std::ostringstream oss;
  oss << "OccupancyGrid::reset: pre-occupied " << target << "/" << capacity << " cells (seed " << seed << ")";
  PARKWISE_LOG_DEBUG(oss.str());
}

bool OccupancyGrid::isFree(int bay, int slot) const {
  const Cell c{bay, slot};
  if (!facility_.contains(c)) return false;
  return !cells_[facility_.actionId(c)].has_value();
}

bool OccupancyGrid::occupy(int bay, int slot, const Reservation& reservation, AllocError* outError) {
  const Cell c{bay, slot};
  if (!facility_.contains(c)) {
    return fail(outError, ErrorCode::OutOfRange, "occupy: cell " + cellText(bay, slot) + " is outside the facility");
  }
  if (!reservation.validWindow()) {
    return fail(outError, ErrorCode::InvalidRequest,
                "occupy: reservation for '" + reservation.vehicleId + "' has departure <= arrival");
  }

  auto& cell = cells_[facility_.actionId(c)];
  if (cell.has_value()) {
    const std::string msg = "occupy: cell " + cellText(bay, slot) + " already held by '" + cell->vehicleId +
                            "', rejected '" + reservation.vehicleId + "'";
    PARKWISE_LOG_WARN(msg);
    return fail(outError, ErrorCode::Conflict, msg);
  }

  cell = reservation;
  ++occupied_;
  return true;
}

bool OccupancyGrid::release(int bay, int slot, AllocError* outError) {
  const Cell c{bay, slot};
  if (!facility_.contains(c)) {
    return fail(outError, ErrorCode::OutOfRange, "release: cell " + cellText(bay, slot) + " is outside the facility");
  }

  auto& cell = cells_[facility_.actionId(c)];
  if (!cell.has_value()) {
    return fail(outError, ErrorCode::NotOccupied, "release: cell " + cellText(bay, slot) + " is already free");
  }

  cell.reset();
  --occupied_;
  return true;
}

int OccupancyGrid::releaseExpired(EpochSec now) {
  int released = 0;
  for (auto& cell : cells_) {
    if (cell.has_value() && cell->expiredAt(now)) {
      cell.reset();
      ++released;
    }
  }
  occupied_ -= released;
  return released;
}

const Reservation* OccupancyGrid::reservationAt(const Cell& c) const {
  if (!facility_.contains(c)) return nullptr;
  const auto& cell = cells_[facility_.actionId(c)];
  return cell.has_value() ? &*cell : nullptr;
}

} // namespace parkwise::alloc
