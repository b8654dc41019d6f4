#include "parkwise/alloc/AllocationService.h"

#include "parkwise/core/Log.h"

#include <exception>
#include <sstream>
#include <utility>

namespace parkwise::alloc {

static std::string idText(RecordId id) {
  return "allocation " + std::to_string(id);
}

static Reservation reservationOf(const AllocationRecord& r) {
  Reservation res;
  res.vehicleId = r.vehicleId;
  res.arrivalTime = r.allocationTime;
  res.departureTime = r.departureTime;
  res.priorityLevel = r.priorityLevel;
  return res;
}

static Cell cellOf(const AllocationRecord& r) {
  return Cell{r.bayAssigned - 1, r.slotAssigned - 1};
}

AllocationService::AllocationService(const EngineConfig& config, Policy policy, RecordStore& store)
  : facility_(config.facility), policy_(std::move(policy)), store_(store), grid_(config.facility) {
  grid_.reset(config.initialFillRatio, config.fillSeed);
}

bool AllocationService::allocate(const VehicleRequest& request, AllocationRecord& out, AllocError* outError) {
  if (!request.validWindow()) {
    return fail(outError, ErrorCode::InvalidRequest,
                "request '" + request.vehicleId + "': departure must be after arrival");
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (request.arrivalTime < clock_) {
    return fail(outError, ErrorCode::InvalidRequest,
                "request '" + request.vehicleId + "' arrives at " + formatTimestamp(request.arrivalTime) +
                  ", before the service clock " + formatTimestamp(clock_));
  }
  advanceClockLocked(request.arrivalTime);

  AllocationDecision d;
  try {
    if (!decide(policy_, request, grid_, d, outError)) return false;
  } catch (const std::exception& e) {
    PARKWISE_LOG_WARN("AllocationService: scoring threw for '" + request.vehicleId + "': " + e.what());
    return fail(outError, ErrorCode::ScoringFailed, std::string("scoring threw: ") + e.what());
  } catch (...) {
    PARKWISE_LOG_WARN("AllocationService: scoring threw a non-standard exception for '" + request.vehicleId + "'");
    return fail(outError, ErrorCode::ScoringFailed, "scoring threw a non-standard exception");
  }

  if (!d.allocated()) {
    PARKWISE_LOG_INFO("AllocationService: no slot for '" + request.vehicleId + "'");
    return fail(outError, ErrorCode::CapacityExhausted, "capacity exhausted");
  }

  Reservation res;
  res.vehicleId = request.vehicleId;
  res.arrivalTime = request.arrivalTime;
  res.departureTime = request.departureTime;
  res.priorityLevel = request.priorityLevel;
  if (!grid_.occupy(d.cell, res, outError)) return false;

  AllocationRecord rec;
  rec.vehicleId = request.vehicleId;
  rec.plateType = request.plateType;
  rec.vehicleClass = request.vehicleClass;
  rec.bayAssigned = d.bayAssigned;
  rec.slotAssigned = d.slotAssigned;
  rec.score = d.score;
  rec.allocationTime = request.arrivalTime;
  rec.departureTime = request.departureTime;
  rec.priorityLevel = request.priorityLevel;
  rec.active = true;
  rec.id = store_.create(rec);

  std::ostringstream oss;
  oss << "AllocationService: '" << rec.vehicleId << "' -> bay " << rec.bayAssigned << " slot " << rec.slotAssigned
      << " (" << idText(rec.id) << ")";
  PARKWISE_LOG_DEBUG(oss.str());

  out = std::move(rec);
  return true;
}

std::vector<std::optional<AllocationRecord>> AllocationService::allocateBulk(
  const std::vector<VehicleRequest>& requests, std::vector<AllocError>* outErrors) {
  std::vector<std::optional<AllocationRecord>> results;
  results.reserve(requests.size());
  if (outErrors) {
    outErrors->clear();
    outErrors->reserve(requests.size());
  }

  for (const auto& req : requests) {
    AllocationRecord rec;
    AllocError err;
    if (allocate(req, rec, &err)) {
      results.emplace_back(std::move(rec));
    } else {
      results.emplace_back(std::nullopt);
    }
    if (outErrors) outErrors->push_back(std::move(err));
  }
  return results;
}

bool AllocationService::endAllocation(RecordId id, AllocationRecord* out, AllocError* outError) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto rec = store_.get(id);
  if (!rec) return fail(outError, ErrorCode::NotFound, idText(id) + " does not exist");
  if (!rec->active) return fail(outError, ErrorCode::InvalidRequest, idText(id) + " has already ended");

  const Cell c = cellOf(*rec);
  const Reservation* held = grid_.reservationAt(c);
  if (held && held->vehicleId == rec->vehicleId) {
    if (!grid_.release(c, outError)) return false;
  }

  RecordPatch patch;
  patch.active = false;
  const auto updated = store_.update(id, patch);
  if (!updated) return fail(outError, ErrorCode::NotFound, idText(id) + " vanished from the store");

  PARKWISE_LOG_DEBUG("AllocationService: ended " + idText(id));
  if (out) *out = *updated;
  return true;
}

bool AllocationService::extendAllocation(RecordId id, EpochSec newDeparture, AllocationRecord* out,
                                         AllocError* outError) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto rec = store_.get(id);
  if (!rec) return fail(outError, ErrorCode::NotFound, idText(id) + " does not exist");
  if (!rec->active) return fail(outError, ErrorCode::InvalidRequest, idText(id) + " has already ended");
  if (newDeparture <= rec->allocationTime) {
    return fail(outError, ErrorCode::InvalidRequest, idText(id) + ": new departure must be after the allocation time");
  }
  if (rec->departureTime <= clock_) {
    return fail(outError, ErrorCode::InvalidRequest, idText(id) + " has already departed");
  }

  AllocationRecord extended = *rec;
  extended.departureTime = newDeparture;

  const Cell c = cellOf(*rec);
  const Reservation* held = grid_.reservationAt(c);
  if (held && held->vehicleId != rec->vehicleId) {
    return fail(outError, ErrorCode::Conflict,
                idText(id) + ": slot is now held by '" + held->vehicleId + "'");
  }
  if (held && !grid_.release(c, outError)) return false;
  if (!grid_.occupy(c, reservationOf(extended), outError)) return false;

  RecordPatch patch;
  patch.departureTime = newDeparture;
  const auto updated = store_.update(id, patch);
  if (!updated) return fail(outError, ErrorCode::NotFound, idText(id) + " vanished from the store");

  PARKWISE_LOG_DEBUG("AllocationService: extended " + idText(id) + " to " + formatTimestamp(newDeparture));
  if (out) *out = *updated;
  return true;
}

FacilityStatus AllocationService::status(EpochSec now, ExpiredReservationMode mode) const {
  return buildFacilityStatus(snapshot(), now, mode);
}

GridSnapshot AllocationService::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return grid_.snapshot();
}

bool AllocationService::placeLocked(const AllocationRecord& record, AllocError* outError) {
  return grid_.occupy(cellOf(record), reservationOf(record), outError);
}

int AllocationService::advanceClock(EpochSec now) {
  std::lock_guard<std::mutex> lock(mutex_);
  return advanceClockLocked(now);
}

EpochSec AllocationService::clock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clock_;
}

int AllocationService::advanceClockLocked(EpochSec now) {
  if (now <= clock_) return 0;
  clock_ = now;
  const int released = grid_.releaseExpired(now);
  if (released > 0) PARKWISE_LOG_DEBUG("AllocationService: released " + std::to_string(released) + " departed cells");
  return released;
}

int AllocationService::rebuildFromStore(EpochSec now) {
  std::lock_guard<std::mutex> lock(mutex_);
  grid_.reset(0.0);
  clock_ = now;

  RecordFilter filter;
  filter.activeOnly = true;

  int restored = 0;
  for (const auto& rec : store_.list(filter)) {
    if (!rec.occupiesAt(now)) continue;
    AllocError err;
    if (!placeLocked(rec, &err)) {
      PARKWISE_LOG_WARN("AllocationService: skipped " + idText(rec.id) + " on rebuild: " + err.message);
      continue;
    }
    ++restored;
  }

  PARKWISE_LOG_INFO("AllocationService: rebuilt grid with " + std::to_string(restored) + " allocations");
  return restored;
}

bool commitSimulation(const SimulationReport& report, const std::vector<VehicleRequest>& requests, RecordStore& store,
                      AllocError* outError) {
  if (report.outcomes.size() != requests.size()) {
    std::ostringstream oss;
    oss << "report has " << report.outcomes.size() << " outcomes for " << requests.size() << " requests";
    return fail(outError, ErrorCode::InvalidRequest, oss.str());
  }
  for (std::size_t i = 0; i < requests.size(); ++i) {
    if (report.outcomes[i].vehicleId != requests[i].vehicleId) {
      return fail(outError, ErrorCode::InvalidRequest,
                  "outcome " + std::to_string(i) + " belongs to '" + report.outcomes[i].vehicleId + "', not '" +
                    requests[i].vehicleId + "'");
    }
  }

  store.clear();
  int written = 0;
  for (std::size_t i = 0; i < requests.size(); ++i) {
    const SimulationOutcome& o = report.outcomes[i];
    if (!o.success) continue;

    const VehicleRequest& req = requests[i];
    AllocationRecord rec;
    rec.vehicleId = req.vehicleId;
    rec.plateType = req.plateType;
    rec.vehicleClass = req.vehicleClass;
    rec.bayAssigned = o.decision.bayAssigned;
    rec.slotAssigned = o.decision.slotAssigned;
    rec.score = o.decision.score;
    rec.allocationTime = req.arrivalTime;
    rec.departureTime = req.departureTime;
    rec.priorityLevel = req.priorityLevel;
    rec.active = true;
    store.create(rec);
    ++written;
  }

  PARKWISE_LOG_INFO("commitSimulation: wrote " + std::to_string(written) + " " + toString(report.policy) + " records");
  return true;
}

} // namespace parkwise::alloc
