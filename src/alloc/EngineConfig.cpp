#include "parkwise/alloc/EngineConfig.h"

#include "parkwise/core/Log.h"

#include <cmath>
#include <limits>
#include <sstream>

namespace parkwise::alloc {

using core::CVar_Archive;

SimulationParams EngineConfig::simulationParams() const {
  SimulationParams p;
  p.facility = facility;
  p.initialFillRatio = initialFillRatio;
  p.fillSeed = fillSeed;
  p.releaseOnDeparture = releaseOnDeparture;
  return p;
}

void installEngineCVars(core::CVarRegistry& reg) {
  const EngineConfig d{};

  reg.defineInt("facility.bays", d.facility.numBays, CVar_Archive, "Number of bays (>= 1)");
  reg.defineInt("facility.slots_per_bay", d.facility.slotsPerBay, CVar_Archive, "Slots in each bay (>= 1)");

  reg.defineString("policy.kind", toString(d.policy), CVar_Archive, "Allocation policy: learned|sequential|random");
  reg.defineFloat("policy.blend_weight", d.blendWeight, CVar_Archive,
                  "Weight of the value table in the learned policy score");
  reg.defineInt("policy.random_seed", static_cast<std::int64_t>(d.randomSeed), CVar_Archive,
                "Seed of the random policy");
  reg.defineInt("policy.candidate_count", d.scoring.candidateCount, CVar_Archive,
                "Ranked cells considered by the learned policy (0 = all)");

  reg.defineFloat("scoring.bay_distance_weight", d.scoring.bayDistanceWeight, CVar_Archive,
                  "Score penalty per bay away from the preferred bay");
  reg.defineFloat("scoring.slot_distance_weight", d.scoring.slotDistanceWeight, CVar_Archive,
                  "Score penalty per slot away from the preferred slot");

  reg.defineInt("valuetable.occupancy_buckets", d.occupancyBuckets, CVar_Archive, "Occupancy buckets of the value table");
  reg.defineInt("valuetable.hour_buckets", d.hourBuckets, CVar_Archive, "Hour-of-day buckets of the value table");

  reg.defineFloat("sim.initial_fill_ratio", d.initialFillRatio, CVar_Archive, "Pre-occupied fraction in [0,1]");
  reg.defineInt("sim.fill_seed", static_cast<std::int64_t>(d.fillSeed), CVar_Archive, "Seed of the pre-fill");
  reg.defineBool("sim.release_on_departure", d.releaseOnDeparture, CVar_Archive,
                 "Free cells whose departure precedes the next arrival");

  core::installLogCVars(reg);
}

bool validateEngineConfig(const EngineConfig& c, AllocError* outError) {
  std::ostringstream oss;
  if (!c.facility.valid()) {
    oss << "facility must have >= 1 bay and >= 1 slot per bay (got " << c.facility.numBays << "x"
        << c.facility.slotsPerBay << ")";
  } else if (!(c.initialFillRatio >= 0.0 && c.initialFillRatio <= 1.0)) {
    oss << "sim.initial_fill_ratio must be in [0,1] (got " << c.initialFillRatio << ")";
  } else if (!std::isfinite(c.blendWeight)) {
    oss << "policy.blend_weight must be finite";
  } else if (c.scoring.candidateCount < 0) {
    oss << "policy.candidate_count must be >= 0 (got " << c.scoring.candidateCount << ")";
  } else if (!std::isfinite(c.scoring.bayDistanceWeight) || !std::isfinite(c.scoring.slotDistanceWeight)) {
    oss << "scoring distance weights must be finite";
  } else if (c.occupancyBuckets < 1 || c.hourBuckets < 1 || c.hourBuckets > 24) {
    oss << "value table buckets out of range (occupancy " << c.occupancyBuckets << ", hour " << c.hourBuckets << ")";
  }

  const std::string msg = oss.str();
  if (msg.empty()) return true;
  PARKWISE_LOG_ERROR("EngineConfig: " + msg);
  return fail(outError, ErrorCode::BadConfig, msg);
}

static bool toInt(std::int64_t v, const char* name, int& out, AllocError* outError) {
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    return fail(outError, ErrorCode::BadConfig, std::string(name) + " is out of range");
  }
  out = static_cast<int>(v);
  return true;
}

bool engineConfigFromCVars(const core::CVarRegistry& reg, EngineConfig& out, AllocError* outError) {
  const EngineConfig d{};
  EngineConfig c;

  if (!toInt(reg.getInt("facility.bays", d.facility.numBays), "facility.bays", c.facility.numBays, outError)) {
    return false;
  }
  if (!toInt(reg.getInt("facility.slots_per_bay", d.facility.slotsPerBay), "facility.slots_per_bay",
             c.facility.slotsPerBay, outError)) {
    return false;
  }

  const std::string kind = reg.getString("policy.kind", toString(d.policy));
  if (!parsePolicyKind(kind, c.policy)) {
    PARKWISE_LOG_ERROR("EngineConfig: unknown policy.kind '" + kind + "'");
    return fail(outError, ErrorCode::BadConfig, "unknown policy.kind '" + kind + "' (expected learned|sequential|random)");
  }
  c.blendWeight = reg.getFloat("policy.blend_weight", d.blendWeight);
  c.randomSeed = static_cast<core::u64>(reg.getInt("policy.random_seed", static_cast<std::int64_t>(d.randomSeed)));
  if (!toInt(reg.getInt("policy.candidate_count", d.scoring.candidateCount), "policy.candidate_count",
             c.scoring.candidateCount, outError)) {
    return false;
  }

  c.scoring.bayDistanceWeight = reg.getFloat("scoring.bay_distance_weight", d.scoring.bayDistanceWeight);
  c.scoring.slotDistanceWeight = reg.getFloat("scoring.slot_distance_weight", d.scoring.slotDistanceWeight);

  if (!toInt(reg.getInt("valuetable.occupancy_buckets", d.occupancyBuckets), "valuetable.occupancy_buckets",
             c.occupancyBuckets, outError)) {
    return false;
  }
  if (!toInt(reg.getInt("valuetable.hour_buckets", d.hourBuckets), "valuetable.hour_buckets", c.hourBuckets,
             outError)) {
    return false;
  }

  c.initialFillRatio = reg.getFloat("sim.initial_fill_ratio", d.initialFillRatio);
  c.fillSeed = static_cast<core::u64>(reg.getInt("sim.fill_seed", static_cast<std::int64_t>(d.fillSeed)));
  c.releaseOnDeparture = reg.getBool("sim.release_on_departure", d.releaseOnDeparture);

  if (!validateEngineConfig(c, outError)) return false;
  out = c;
  return true;
}

ValueTable makeValueTable(const EngineConfig& config, double initial) {
  return ValueTable(config.occupancyBuckets, config.hourBuckets, config.facility.capacity(), initial);
}

bool makePolicy(PolicyKind kind, const EngineConfig& config, const ScoringAdapter* scoring, Policy& out,
                AllocError* outError) {
  switch (kind) {
    case PolicyKind::Learned: {
      if (!scoring) return fail(outError, ErrorCode::BadConfig, "learned policy needs a scoring adapter");
      const ValueTable& q = scoring->valueTable();
      if (!q.empty() && q.actionCount() != config.facility.capacity()) {
        std::ostringstream oss;
        oss << "value table has " << q.actionCount() << " actions, facility has " << config.facility.capacity()
            << " cells";
        PARKWISE_LOG_ERROR("EngineConfig: " + oss.str());
        return fail(outError, ErrorCode::BadConfig, oss.str());
      }
      out = LearnedPolicy{scoring, config.blendWeight};
      return true;
    }
    case PolicyKind::Sequential:
      out = SequentialPolicy{};
      return true;
    case PolicyKind::Random:
      out = RandomPolicy{core::SplitMix64(config.randomSeed)};
      return true;
  }
  return fail(outError, ErrorCode::BadConfig, "unknown policy kind");
}

} // namespace parkwise::alloc
