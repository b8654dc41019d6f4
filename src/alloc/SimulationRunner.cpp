#include "parkwise/alloc/SimulationRunner.h"

#include "parkwise/core/Log.h"

#include <chrono>
#include <exception>
#include <sstream>

namespace parkwise::alloc {

static void recordFailure(SimulationOutcome& o, ErrorCode code, std::string message) {
  o.success = false;
  o.error = code;
  o.message = std::move(message);
}

SimulationReport runSimulation(const std::vector<VehicleRequest>& requests, Policy& policy,
                               const SimulationParams& params) {
  using clock = std::chrono::steady_clock;
  const auto t0 = clock::now();

  SimulationReport report;
  report.policy = kindOf(policy);
  report.facility = params.facility;
  report.totalVehicles = static_cast<int>(requests.size());
  report.outcomes.reserve(requests.size());

  {
    std::ostringstream oss;
    oss << "Simulation: " << toString(report.policy) << " over " << requests.size() << " requests, facility "
        << params.facility.numBays << "x" << params.facility.slotsPerBay << ", fill " << params.initialFillRatio;
    PARKWISE_LOG_INFO(oss.str());
  }

  OccupancyGrid grid(params.facility);
  grid.reset(params.initialFillRatio, params.fillSeed);

  double scoreSum = 0.0;

  for (const VehicleRequest& req : requests) {
    SimulationOutcome o;
    o.vehicleId = req.vehicleId;

    if (params.releaseOnDeparture) grid.releaseExpired(req.arrivalTime);

    AllocError err;
    AllocationDecision d;
    bool decided = false;
    try {
      decided = decide(policy, req, grid, d, &err);
    } catch (const std::exception& e) {
      err.code = ErrorCode::ScoringFailed;
      err.message = std::string("scoring threw: ") + e.what();
      PARKWISE_LOG_WARN("Simulation: '" + req.vehicleId + "': " + err.message);
    } catch (...) {
      // Scoring callbacks are external code and may throw anything.
      err.code = ErrorCode::ScoringFailed;
      err.message = "scoring threw a non-standard exception";
      PARKWISE_LOG_WARN("Simulation: '" + req.vehicleId + "': " + err.message);
    }

    if (!decided) {
      recordFailure(o, err.code, err.message);
    } else if (!d.allocated()) {
      o.decision = d;
      recordFailure(o, ErrorCode::CapacityExhausted, "capacity exhausted");
      PARKWISE_LOG_DEBUG("Simulation: rejected '" + req.vehicleId + "'");
    } else {
      o.decision = d;
      Reservation r;
      r.vehicleId = req.vehicleId;
      r.arrivalTime = req.arrivalTime;
      r.departureTime = req.departureTime;
      r.priorityLevel = req.priorityLevel;
      if (!grid.occupy(d.cell, r, &err)) {
        recordFailure(o, err.code, err.message);
      } else {
        o.success = true;
        scoreSum += d.score;
        ++report.successful;
      }
    }

    report.outcomes.push_back(std::move(o));
  }

  report.failed = report.totalVehicles - report.successful;
  report.successRate =
    report.totalVehicles > 0 ? static_cast<double>(report.successful) / static_cast<double>(report.totalVehicles) : 0.0;
  report.averageScore = report.successful > 0 ? scoreSum / static_cast<double>(report.successful) : 0.0;
  report.finalGrid = grid.snapshot();
  report.totalProcessingSeconds = std::chrono::duration<double>(clock::now() - t0).count();

  {
    std::ostringstream oss;
    oss << "Simulation: " << toString(report.policy) << " done, " << report.successful << "/" << report.totalVehicles
        << " allocated, avg score " << report.averageScore << ", " << report.totalProcessingSeconds << "s";
    PARKWISE_LOG_INFO(oss.str());
  }
  return report;
}

} // namespace parkwise::alloc
