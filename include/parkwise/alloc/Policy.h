#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/OccupancyGrid.h"
#include "parkwise/alloc/ScoringAdapter.h"
#include "parkwise/alloc/VehicleRequest.h"
#include "parkwise/core/Random.h"
#include "parkwise/core/Types.h"

#include <string_view>
#include <variant>

namespace parkwise::alloc {

enum class PolicyKind : core::u8 {
  Learned    = 0,
  Sequential = 1,
  Random     = 2,
};

inline constexpr int kPolicyKindCount = 3;

const char* toString(PolicyKind k);

// "learned" (alias "algorithm"), "sequential", "random"; case-insensitive.
bool parsePolicyKind(std::string_view text, PolicyKind& out);

// Scores reported by the non-learned policies.
inline constexpr double kSequentialScore = 1.0;
inline constexpr double kRandomScore     = 1.0;

enum class DecisionStatus : core::u8 {
  Allocated = 0,
  Rejected  = 1,
};

const char* toString(DecisionStatus s);

struct AllocationDecision {
  DecisionStatus status{DecisionStatus::Rejected};
  Cell cell{};          // 0-based, valid when allocated
  int bayAssigned{0};   // 1-based
  int slotAssigned{0};  // 1-based
  double score{0.0};
  EpochSec decisionTime{0};

  bool allocated() const { return status == DecisionStatus::Allocated; }
};

// Model-driven choice: modelScore + blendWeight * Q[state][action].
// `scoring` is borrowed and must outlive the policy.
struct LearnedPolicy {
  const ScoringAdapter* scoring{nullptr};
  double blendWeight{0.5};
};

// Lowest free (bay, slot).
struct SequentialPolicy {};

// Uniform over free cells. Owns its generator so a seed reproduces a run.
struct RandomPolicy {
  core::SplitMix64 rng{42};
};

using Policy = std::variant<LearnedPolicy, SequentialPolicy, RandomPolicy>;

PolicyKind kindOf(const Policy& policy);

// Chooses a cell for `request` without touching `grid`.
//
// Returns false (InvalidRequest / ScoringFailed) for bad input. A full grid is
// not a failure: the decision comes back Rejected and the call returns true.
// decisionTime is the request's arrival time.
//
// Only RandomPolicy changes (its generator), hence the non-const policy.
bool decide(Policy& policy, const VehicleRequest& request, const OccupancyGrid& grid,
            AllocationDecision& outDecision, AllocError* outError = nullptr);

} // namespace parkwise::alloc
