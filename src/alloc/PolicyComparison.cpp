#include "parkwise/alloc/PolicyComparison.h"

#include "parkwise/core/JobSystem.h"
#include "parkwise/core/Log.h"

#include <array>
#include <future>

namespace parkwise::alloc {

bool comparePolicies(const std::vector<VehicleRequest>& requests, const EngineConfig& config,
                     const ScoringAdapter* scoring, std::vector<SimulationReport>& out, AllocError* outError,
                     core::JobSystem* jobs) {
  if (!validateEngineConfig(config, outError)) return false;

  constexpr std::array<PolicyKind, kPolicyKindCount> kinds = {
    PolicyKind::Learned, PolicyKind::Sequential, PolicyKind::Random};

  std::array<Policy, kPolicyKindCount> policies;
  for (std::size_t i = 0; i < kinds.size(); ++i) {
    if (!makePolicy(kinds[i], config, scoring, policies[i], outError)) return false;
  }

  const SimulationParams params = config.simulationParams();
  std::vector<SimulationReport> reports(kinds.size());

  if (jobs) {
    std::vector<std::future<SimulationReport>> futures;
    futures.reserve(kinds.size());
    for (std::size_t i = 0; i < kinds.size(); ++i) {
      Policy* policy = &policies[i];
      futures.push_back(jobs->submit([&requests, policy, params]() {
        return runSimulation(requests, *policy, params);
      }));
    }
    for (std::size_t i = 0; i < futures.size(); ++i) reports[i] = futures[i].get();
  } else {
    for (std::size_t i = 0; i < kinds.size(); ++i) reports[i] = runSimulation(requests, policies[i], params);
  }

  PARKWISE_LOG_DEBUG("comparePolicies: " + std::to_string(reports.size()) + " runs finished");
  out = std::move(reports);
  return true;
}

} // namespace parkwise::alloc
