#include "parkwise/alloc/FacilityStatus.h"

#include "parkwise/core/Log.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace parkwise::alloc {

static FacilityStatus emptyStatus(const Facility& f, EpochSec now) {
  FacilityStatus s;
  s.updatedAt = now;
  s.totalSlots = f.capacity();
  s.bays.resize(static_cast<std::size_t>(f.numBays));
  for (int b = 0; b < f.numBays; ++b) {
    BayStatus& bay = s.bays[b];
    bay.bayNumber = b + 1;
    bay.slots.resize(static_cast<std::size_t>(f.slotsPerBay));
    for (int sl = 0; sl < f.slotsPerBay; ++sl) bay.slots[sl].slotNumber = sl + 1;
  }
  return s;
}

static void finishTotals(FacilityStatus& s) {
  s.availableSlots = s.totalSlots - s.occupiedSlots;
  const double pct = s.totalSlots > 0 ? 100.0 * s.occupiedSlots / s.totalSlots : 0.0;
  s.occupancyPercentage = std::round(pct * 10.0) / 10.0;
}

FacilityStatus buildFacilityStatus(const GridSnapshot& snapshot, EpochSec now, ExpiredReservationMode mode) {
  const Facility& f = snapshot.facility;
  FacilityStatus s = emptyStatus(f, now);

  for (int b = 0; b < f.numBays; ++b) {
    for (int sl = 0; sl < f.slotsPerBay; ++sl) {
      const auto& cell = snapshot.at(Cell{b, sl});
      if (!cell.has_value()) continue;
      if (mode == ExpiredReservationMode::LazyFilter && cell->expiredAt(now)) continue;

      SlotStatus& slot = s.bays[b].slots[sl];
      slot.occupied = true;
      slot.reservation = *cell;
      ++s.occupiedSlots;
    }
  }

  finishTotals(s);
  return s;
}

FacilityStatus buildFacilityStatusFromRecords(const Facility& facility, const std::vector<AllocationRecord>& records,
                                              EpochSec now) {
  FacilityStatus s = emptyStatus(facility, now);

  std::vector<const AllocationRecord*> sorted;
  sorted.reserve(records.size());
  for (const auto& r : records) sorted.push_back(&r);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const AllocationRecord* a, const AllocationRecord* b) { return a->id < b->id; });

  for (const AllocationRecord* r : sorted) {
    if (!r->occupiesAt(now)) continue;

    const Cell c{r->bayAssigned - 1, r->slotAssigned - 1};
    if (!facility.contains(c)) {
      std::ostringstream oss;
      oss << "FacilityStatus: record " << r->id << " points at bay " << r->bayAssigned << " slot " << r->slotAssigned
          << " outside the facility";
      PARKWISE_LOG_WARN(oss.str());
      continue;
    }

    SlotStatus& slot = s.bays[c.bay].slots[c.slot];
    if (slot.occupied) {
      std::ostringstream oss;
      oss << "FacilityStatus: record " << r->id << " double-books bay " << r->bayAssigned << " slot "
          << r->slotAssigned << " (held by record " << slot.recordId << ")";
      PARKWISE_LOG_WARN(oss.str());
      continue;
    }

    Reservation res;
    res.vehicleId = r->vehicleId;
    res.arrivalTime = r->allocationTime;
    res.departureTime = r->departureTime;
    res.priorityLevel = r->priorityLevel;

    slot.occupied = true;
    slot.reservation = std::move(res);
    slot.recordId = r->id;
    ++s.occupiedSlots;
  }

  finishTotals(s);
  return s;
}

} // namespace parkwise::alloc
