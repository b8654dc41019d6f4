#pragma once

#include "parkwise/alloc/Time.h"

#include <string>

namespace parkwise::alloc {

// A physical slot, 0-based. External reports use 1-based bay/slot numbers.
struct Cell {
  int bay{0};
  int slot{0};

  bool operator==(const Cell&) const = default;
};

// Immutable shape of a parking facility.
struct Facility {
  int numBays{1};
  int slotsPerBay{1};

  int capacity() const { return numBays * slotsPerBay; }
  bool valid() const { return numBays >= 1 && slotsPerBay >= 1; }

  bool contains(const Cell& c) const {
    return c.bay >= 0 && c.bay < numBays && c.slot >= 0 && c.slot < slotsPerBay;
  }

  // Flattened action id used by the value table: bay-major, slot-minor.
  int actionId(const Cell& c) const { return c.bay * slotsPerBay + c.slot; }
  Cell cellFromAction(int action) const { return Cell{action / slotsPerBay, action % slotsPerBay}; }

  bool operator==(const Facility&) const = default;
};

// Occupancy attached to one cell. Active on [arrivalTime, departureTime).
struct Reservation {
  std::string vehicleId;
  EpochSec arrivalTime{0};
  EpochSec departureTime{0};
  int priorityLevel{1};

  bool validWindow() const { return arrivalTime < departureTime; }
  bool activeAt(EpochSec now) const { return now >= arrivalTime && now < departureTime; }
  bool expiredAt(EpochSec now) const { return now >= departureTime; }
};

} // namespace parkwise::alloc
