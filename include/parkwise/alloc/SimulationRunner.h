#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/OccupancyGrid.h"
#include "parkwise/alloc/Policy.h"
#include "parkwise/alloc/VehicleRequest.h"
#include "parkwise/core/Types.h"

#include <string>
#include <vector>

namespace parkwise::alloc {

struct SimulationParams {
  Facility facility{4, 10};
  double initialFillRatio{0.0};
  core::u64 fillSeed{7};
  // When set, reservations whose departure is <= the next request's arrival
  // are released before that request is decided. Off by default: a batch
  // otherwise treats every allocation as held for the whole run.
  bool releaseOnDeparture{false};
};

struct SimulationOutcome {
  std::string vehicleId;
  bool success{false};
  AllocationDecision decision{};
  ErrorCode error{ErrorCode::None};
  std::string message; // empty on success
};

struct SimulationReport {
  PolicyKind policy{PolicyKind::Sequential};
  Facility facility{};

  int totalVehicles{0};
  int successful{0};
  int failed{0};
  double successRate{0.0};
  // Mean score over successful outcomes; 0.0 when nothing was allocated.
  double averageScore{0.0};
  double totalProcessingSeconds{0.0};

  // One per input request, in input order.
  std::vector<SimulationOutcome> outcomes;

  // Grid state after the last request.
  GridSnapshot finalGrid{};
};

// Replays `requests` in order against a fresh grid. Always returns one outcome
// per request; per-request failures (invalid input, scoring errors including
// exceptions thrown by scoring callbacks, occupy conflicts, exhausted
// capacity) become failed outcomes.
SimulationReport runSimulation(const std::vector<VehicleRequest>& requests, Policy& policy,
                               const SimulationParams& params);

} // namespace parkwise::alloc
