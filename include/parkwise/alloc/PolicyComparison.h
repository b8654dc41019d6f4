#pragma once

#include "parkwise/alloc/EngineConfig.h"
#include "parkwise/alloc/SimulationRunner.h"

#include <vector>

namespace parkwise::core {
class JobSystem;
}

namespace parkwise::alloc {

// Runs the same requests through every policy, each on its own grid built from
// config.simulationParams(). Reports come back in Learned, Sequential, Random
// order. With `jobs` the three runs execute in parallel; `scoring` is shared
// read-only.
bool comparePolicies(const std::vector<VehicleRequest>& requests, const EngineConfig& config,
                     const ScoringAdapter* scoring, std::vector<SimulationReport>& out,
                     AllocError* outError = nullptr, core::JobSystem* jobs = nullptr);

} // namespace parkwise::alloc
