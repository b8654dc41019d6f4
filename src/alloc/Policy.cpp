#include "parkwise/alloc/Policy.h"

#include "parkwise/core/Log.h"

#include <cctype>
#include <string>
#include <type_traits>
#include <vector>

namespace parkwise::alloc {

const char* toString(PolicyKind k) {
  switch (k) {
    case PolicyKind::Learned:    return "learned";
    case PolicyKind::Sequential: return "sequential";
    case PolicyKind::Random:     return "random";
  }
  return "?";
}

bool parsePolicyKind(std::string_view text, PolicyKind& out) {
  std::string k;
  for (char c : text) k.push_back((char)std::tolower((unsigned char)c));

  if (k == "learned" || k == "algorithm") { out = PolicyKind::Learned;    return true; }
  if (k == "sequential")                  { out = PolicyKind::Sequential; return true; }
  if (k == "random")                      { out = PolicyKind::Random;     return true; }
  return false;
}

const char* toString(DecisionStatus s) {
  switch (s) {
    case DecisionStatus::Allocated: return "allocated";
    case DecisionStatus::Rejected:  return "rejected";
  }
  return "?";
}

PolicyKind kindOf(const Policy& policy) {
  return std::visit([](const auto& p) -> PolicyKind {
    using T = std::decay_t<decltype(p)>;
    if constexpr (std::is_same_v<T, LearnedPolicy>) return PolicyKind::Learned;
    else if constexpr (std::is_same_v<T, SequentialPolicy>) return PolicyKind::Sequential;
    else return PolicyKind::Random;
  }, policy);
}

namespace {

AllocationDecision allocatedAt(const Cell& c, double score, EpochSec when) {
  AllocationDecision d;
  d.status = DecisionStatus::Allocated;
  d.cell = c;
  d.bayAssigned = c.bay + 1;
  d.slotAssigned = c.slot + 1;
  d.score = score;
  d.decisionTime = when;
  return d;
}

AllocationDecision rejectedAt(EpochSec when) {
  AllocationDecision d;
  d.status = DecisionStatus::Rejected;
  d.decisionTime = when;
  return d;
}

bool decideLearned(const LearnedPolicy& p, const VehicleRequest& req, const OccupancyGrid& grid,
                   AllocationDecision& out, AllocError* outError) {
  if (!p.scoring) {
    return fail(outError, ErrorCode::ScoringFailed, "learned policy has no scoring adapter");
  }
  const ScoringAdapter& scoring = *p.scoring;
  const Facility& f = grid.facility();

  ScoringContext ctx;
  if (!scoring.evaluate(req, grid, ctx, outError)) return false;

  auto combined = [&](const Cell& c, double modelScore) {
    return modelScore + p.blendWeight * scoring.value(ctx.state, f.actionId(c));
  };

  bool found = false;
  Cell best{};
  double bestScore = 0.0;
  auto consider = [&](const Cell& c, double s) {
    // Ties go to the lower action id.
    if (!found || s > bestScore || (s == bestScore && f.actionId(c) < f.actionId(best))) {
      found = true;
      best = c;
      bestScore = s;
    }
  };

  for (const Candidate& cand : scoring.rankCandidates(ctx, f)) {
    if (!grid.isFree(cand.cell)) continue;
    consider(cand.cell, combined(cand.cell, cand.score));
  }

  if (!found) {
    // Every ranked candidate is taken: score the remaining free cells.
    for (const Cell c : grid.freeCells()) {
      consider(c, combined(c, scoring.scoreCell(ctx.pref, c, f)));
    }
    if (found) PARKWISE_LOG_TRACE("LearnedPolicy: fell back to full scan for '" + req.vehicleId + "'");
  }

  if (!found) {
    out = rejectedAt(req.arrivalTime);
    return true;
  }
  out = allocatedAt(best, bestScore, req.arrivalTime);
  return true;
}

bool decideSequential(const VehicleRequest& req, const OccupancyGrid& grid, AllocationDecision& out) {
  const auto free = grid.freeCells();
  const auto it = free.begin();
  out = (it == free.end()) ? rejectedAt(req.arrivalTime) : allocatedAt(*it, kSequentialScore, req.arrivalTime);
  return true;
}

bool decideRandom(RandomPolicy& p, const VehicleRequest& req, const OccupancyGrid& grid, AllocationDecision& out) {
  const int n = grid.freeCount();
  if (n <= 0) {
    out = rejectedAt(req.arrivalTime);
    return true;
  }
  const std::size_t pick = p.rng.nextIndex(static_cast<std::size_t>(n));
  auto it = grid.freeCells().begin();
  for (std::size_t i = 0; i < pick; ++i) ++it;
  out = allocatedAt(*it, kRandomScore, req.arrivalTime);
  return true;
}

} // namespace

bool decide(Policy& policy, const VehicleRequest& request, const OccupancyGrid& grid,
            AllocationDecision& outDecision, AllocError* outError) {
  if (!request.validWindow()) {
    return fail(outError, ErrorCode::InvalidRequest,
                "request '" + request.vehicleId + "': departure must be after arrival");
  }

  if (grid.freeCount() <= 0) {
    PARKWISE_LOG_DEBUG("decide: no free cell for '" + request.vehicleId + "'");
    outDecision = rejectedAt(request.arrivalTime);
    return true;
  }

  return std::visit([&](auto& p) -> bool {
    using T = std::decay_t<decltype(p)>;
    if constexpr (std::is_same_v<T, LearnedPolicy>) return decideLearned(p, request, grid, outDecision, outError);
    else if constexpr (std::is_same_v<T, SequentialPolicy>) return decideSequential(request, grid, outDecision);
    else return decideRandom(p, request, grid, outDecision);
  }, policy);
}

} // namespace parkwise::alloc
