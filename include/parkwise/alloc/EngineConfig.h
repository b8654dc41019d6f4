#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/Facility.h"
#include "parkwise/alloc/Policy.h"
#include "parkwise/alloc/ScoringAdapter.h"
#include "parkwise/alloc/SimulationRunner.h"
#include "parkwise/core/CVar.h"
#include "parkwise/core/Types.h"

namespace parkwise::alloc {

// Engine settings gathered from the cvar registry. Defaults match the values
// installEngineCVars() registers.
struct EngineConfig {
  Facility facility{4, 10};

  PolicyKind policy{PolicyKind::Learned};
  double blendWeight{0.5};
  core::u64 randomSeed{42};

  ScoringParams scoring{};

  int occupancyBuckets{10};
  int hourBuckets{4};

  double initialFillRatio{0.0};
  core::u64 fillSeed{7};
  bool releaseOnDeparture{false};

  SimulationParams simulationParams() const;
};

// Defines facility.*, policy.*, scoring.*, valuetable.* and sim.* with the
// EngineConfig defaults, plus log.level. Idempotent.
void installEngineCVars(core::CVarRegistry& reg);

bool validateEngineConfig(const EngineConfig& config, AllocError* outError = nullptr);

// Reads and validates. `out` is untouched on failure.
bool engineConfigFromCVars(const core::CVarRegistry& reg, EngineConfig& out, AllocError* outError = nullptr);

// A zero-filled table shaped for `config` (one action per cell).
ValueTable makeValueTable(const EngineConfig& config, double initial = 0.0);

// Builds the policy named by `kind`. Learned needs `scoring` (borrowed), and
// a non-empty value table must have one action per facility cell.
bool makePolicy(PolicyKind kind, const EngineConfig& config, const ScoringAdapter* scoring, Policy& out,
                AllocError* outError = nullptr);

} // namespace parkwise::alloc
