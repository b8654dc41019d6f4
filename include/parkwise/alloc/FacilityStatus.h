#pragma once

#include "parkwise/alloc/Facility.h"
#include "parkwise/alloc/OccupancyGrid.h"
#include "parkwise/alloc/RecordStore.h"
#include "parkwise/core/Types.h"

#include <optional>
#include <vector>

namespace parkwise::alloc {

// How a recorded reservation whose departure has passed is reported.
enum class ExpiredReservationMode : core::u8 {
  LazyFilter = 0, // reported free, the grid itself is not touched
  TrustGrid  = 1, // reported exactly as recorded
};

struct SlotStatus {
  int slotNumber{0}; // 1-based
  bool occupied{false};
  std::optional<Reservation> reservation;
  RecordId recordId{0}; // 0 when the status was not built from records
};

struct BayStatus {
  int bayNumber{0}; // 1-based
  std::vector<SlotStatus> slots;
};

struct FacilityStatus {
  std::vector<BayStatus> bays;
  int totalSlots{0};
  int occupiedSlots{0};
  int availableSlots{0};
  double occupancyPercentage{0.0}; // rounded to one decimal
  EpochSec updatedAt{0};
};

// `now` is the single time reference for the whole report.
FacilityStatus buildFacilityStatus(const GridSnapshot& snapshot, EpochSec now,
                                   ExpiredReservationMode mode = ExpiredReservationMode::LazyFilter);

// Derives occupancy from allocation records: an active record whose departure
// is after `now` holds its slot. Records pointing outside the facility are
// skipped; when two records claim one slot the lower id wins.
FacilityStatus buildFacilityStatusFromRecords(const Facility& facility, const std::vector<AllocationRecord>& records,
                                              EpochSec now);

} // namespace parkwise::alloc
