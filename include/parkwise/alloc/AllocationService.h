#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/EngineConfig.h"
#include "parkwise/alloc/FacilityStatus.h"
#include "parkwise/alloc/OccupancyGrid.h"
#include "parkwise/alloc/Policy.h"
#include "parkwise/alloc/RecordStore.h"
#include "parkwise/alloc/SimulationRunner.h"
#include "parkwise/alloc/VehicleRequest.h"

#include <limits>
#include <mutex>
#include <optional>
#include <vector>

namespace parkwise::alloc {

// Live allocation front end: one grid, one policy, one record store.
//
// Every mutation (decide + occupy + persist, end, extend, rebuild) runs under
// one mutex, so two callers can never both commit the same free cell. Status
// queries copy the grid under the same mutex and render outside it.
//
// The service keeps a monotonic clock. allocate() advances it to the request's
// arrival and releases reservations that departed by then; a request arriving
// before the clock is rejected, since the cells it would overlap may already
// have been released.
class AllocationService {
public:
  // The grid starts pre-filled per config.initialFillRatio / fillSeed. The
  // store is borrowed and must outlive the service.
  AllocationService(const EngineConfig& config, Policy policy, RecordStore& store);

  AllocationService(const AllocationService&) = delete;
  AllocationService& operator=(const AllocationService&) = delete;

  const Facility& facility() const { return facility_; }

  // Fails with InvalidRequest (empty window, or arrival before clock()),
  // ScoringFailed or CapacityExhausted.
  bool allocate(const VehicleRequest& request, AllocationRecord& out, AllocError* outError = nullptr);

  // In order; nullopt where a request failed. `outErrors`, when given, gets
  // one entry per request (code None on success).
  std::vector<std::optional<AllocationRecord>> allocateBulk(const std::vector<VehicleRequest>& requests,
                                                            std::vector<AllocError>* outErrors = nullptr);

  // Marks the record inactive and frees its cell. NotFound for unknown ids,
  // InvalidRequest when already ended.
  bool endAllocation(RecordId id, AllocationRecord* out = nullptr, AllocError* outError = nullptr);

  // Moves the departure time. It must stay after the allocation time, and the
  // allocation must not have departed as of clock().
  bool extendAllocation(RecordId id, EpochSec newDeparture, AllocationRecord* out = nullptr,
                        AllocError* outError = nullptr);

  std::optional<AllocationRecord> getAllocation(RecordId id) const { return store_.get(id); }
  std::vector<AllocationRecord> listAllocations(const RecordFilter& filter = {}) const { return store_.list(filter); }

  FacilityStatus status(EpochSec now, ExpiredReservationMode mode = ExpiredReservationMode::LazyFilter) const;

  // Empties the grid and re-occupies every record that holds its slot at
  // `now`. Returns the number of cells restored; conflicting records are
  // logged and skipped.
  int rebuildFromStore(EpochSec now);

  GridSnapshot snapshot() const;

  // Moves the clock forward to `now` and releases departed reservations.
  // An earlier `now` leaves the clock alone. Returns the cells released.
  int advanceClock(EpochSec now);
  EpochSec clock() const;

private:
  // Called with mutex_ held.
  bool placeLocked(const AllocationRecord& record, AllocError* outError);
  int advanceClockLocked(EpochSec now);

  Facility facility_;
  Policy policy_;
  RecordStore& store_;

  mutable std::mutex mutex_;
  OccupancyGrid grid_;
  EpochSec clock_{std::numeric_limits<EpochSec>::min()};
};

// Replaces the contents of `store` with one active record per allocated
// outcome of `report`. `requests` must be the batch the report was run on.
bool commitSimulation(const SimulationReport& report, const std::vector<VehicleRequest>& requests, RecordStore& store,
                      AllocError* outError = nullptr);

} // namespace parkwise::alloc
