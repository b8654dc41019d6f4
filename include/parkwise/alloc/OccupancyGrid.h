#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/Facility.h"
#include "parkwise/core/Types.h"

#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

namespace parkwise::alloc {

// -----------------------------------------------------------------------------
// Occupancy grid
// -----------------------------------------------------------------------------
//
// Ground truth for which cells of one facility hold a reservation. A cell is
// occupied iff a reservation is recorded for it; time-based expiry is applied
// either explicitly (releaseExpired) or by the status renderer (lazy filter).
//
// occupy()/release() are the only write paths. They validate first and mutate
// last, so a failed call leaves the grid untouched.
//
// Not internally synchronised. Callers that share a grid between threads must
// serialise writers and keep readers off the grid while a write is in flight
// (see AllocationService).

// Synthetic reservations created by reset(): never expire.
inline constexpr EpochSec kPrefillArrival   = 0;
inline constexpr EpochSec kPrefillDeparture = 253402300799; // 9999-12-31T23:59:59Z

using CellStates = std::vector<std::optional<Reservation>>;

// Read-only copy of a grid, indexed by Facility::actionId().
struct GridSnapshot {
  Facility facility{};
  CellStates cells;

  const std::optional<Reservation>& at(const Cell& c) const { return cells[facility.actionId(c)]; }
};

// Forward iterator over free cells in bay-major, slot-minor order.
// Invalidated by any mutation of the grid it was obtained from.
class FreeCellIterator {
public:
  using iterator_category = std::forward_iterator_tag;
  using value_type = Cell;
  using difference_type = std::ptrdiff_t;
  using pointer = const Cell*;
  using reference = Cell;

  FreeCellIterator() = default;
  FreeCellIterator(const CellStates* cells, int slotsPerBay, int action)
    : cells_(cells), slotsPerBay_(slotsPerBay), action_(action) {
    skipOccupied();
  }

  Cell operator*() const { return Cell{action_ / slotsPerBay_, action_ % slotsPerBay_}; }

  FreeCellIterator& operator++() {
    ++action_;
    skipOccupied();
    return *this;
  }

  FreeCellIterator operator++(int) {
    FreeCellIterator tmp = *this;
    ++(*this);
    return tmp;
  }

  bool operator==(const FreeCellIterator& o) const { return cells_ == o.cells_ && action_ == o.action_; }

private:
  void skipOccupied() {
    const int n = static_cast<int>(cells_->size());
    while (action_ < n && (*cells_)[action_].has_value()) ++action_;
  }

  const CellStates* cells_{nullptr};
  int slotsPerBay_{1};
  int action_{0};
};

// Lazy view returned by OccupancyGrid::freeCells().
class FreeCellRange {
public:
  FreeCellRange(const CellStates* cells, int slotsPerBay) : cells_(cells), slotsPerBay_(slotsPerBay) {}

  FreeCellIterator begin() const { return FreeCellIterator(cells_, slotsPerBay_, 0); }
  FreeCellIterator end() const { return FreeCellIterator(cells_, slotsPerBay_, static_cast<int>(cells_->size())); }

  bool empty() const { return begin() == end(); }
  std::vector<Cell> collect() const { return std::vector<Cell>(begin(), end()); }

private:
  const CellStates* cells_;
  int slotsPerBay_;
};

class OccupancyGrid {
public:
  // `facility` must be valid() (checked).
  explicit OccupancyGrid(const Facility& facility);

  const Facility& facility() const { return facility_; }

  // Clears every reservation, then pre-occupies round(ratio * capacity) cells
  // picked deterministically from `seed`. Ratios outside [0,1] are clamped.
  void reset(double initialFillRatio = 0.0, core::u64 seed = 0);

  // False for cells outside the facility.
  bool isFree(int bay, int slot) const;
  bool isFree(const Cell& c) const { return isFree(c.bay, c.slot); }

  // Fails with OutOfRange, InvalidRequest (empty window) or Conflict.
  bool occupy(int bay, int slot, const Reservation& reservation, AllocError* outError = nullptr);
  bool occupy(const Cell& c, const Reservation& reservation, AllocError* outError = nullptr) {
    return occupy(c.bay, c.slot, reservation, outError);
  }

  // Fails with OutOfRange or NotOccupied.
  bool release(int bay, int slot, AllocError* outError = nullptr);
  bool release(const Cell& c, AllocError* outError = nullptr) { return release(c.bay, c.slot, outError); }

  // Releases every reservation with departureTime <= now. Returns the count.
  int releaseExpired(EpochSec now);

  FreeCellRange freeCells() const { return FreeCellRange(&cells_, facility_.slotsPerBay); }

  GridSnapshot snapshot() const { return GridSnapshot{facility_, cells_}; }

  // nullptr when free or out of range.
  const Reservation* reservationAt(const Cell& c) const;

  int occupiedCount() const { return occupied_; }
  int freeCount() const { return facility_.capacity() - occupied_; }
  double occupancyRatio() const {
    return static_cast<double>(occupied_) / static_cast<double>(facility_.capacity());
  }

private:
  Facility facility_;
  CellStates cells_;
  int occupied_{0};
};

} // namespace parkwise::alloc
