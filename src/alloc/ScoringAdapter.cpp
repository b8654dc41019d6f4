#include "parkwise/alloc/ScoringAdapter.h"

#include "parkwise/core/Log.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace parkwise::alloc {

ScoringAdapter::ScoringAdapter(ScoringFunctions functions, ValueTable values, ScoringParams params)
  : functions_(std::move(functions)), values_(std::move(values)), params_(params) {
  if (params_.candidateCount < 0) params_.candidateCount = 0;
}

FeatureVector ScoringAdapter::features(const VehicleRequest& request, const OccupancyGrid& grid) {
  FeatureVector x{};
  x[Feature_DurationHours] = request.durationHours;
  x[Feature_DayOfWeek] = static_cast<double>(request.dayOfWeek);
  x[Feature_HourOfDay] = static_cast<double>(request.hourOfDay);
  x[Feature_Priority] = static_cast<double>(request.priorityLevel);
  x[Feature_OccupancyRatio] = grid.occupancyRatio();
  x[Feature_PlateType] = static_cast<double>(static_cast<int>(request.plateType));
  return x;
}

bool ScoringAdapter::evaluate(const VehicleRequest& request, const OccupancyGrid& grid, ScoringContext& out,
                              AllocError* outError) const {
  if (!functions_.complete()) {
    return fail(outError, ErrorCode::ScoringFailed, "scoring functions are not configured");
  }

  const Facility& f = grid.facility();
  ScoringContext ctx;
  ctx.features = features(request, grid);

  ctx.pref.suitability = functions_.suitability(ctx.features);
  if (!std::isfinite(ctx.pref.suitability)) {
    std::ostringstream oss;
    oss << "suitability for '" << request.vehicleId << "' is not finite (" << ctx.pref.suitability << ")";
    PARKWISE_LOG_WARN("ScoringAdapter: " + oss.str());
    return fail(outError, ErrorCode::ScoringFailed, oss.str());
  }

  ctx.pref.bay = std::clamp(functions_.bayPreference(ctx.features), 0, f.numBays - 1);
  ctx.pref.slot = std::clamp(functions_.slotPreference(ctx.features), 0, f.slotsPerBay - 1);
  ctx.state = values_.discretize(grid.occupancyRatio(), request.hourOfDay);

  out = ctx;
  return true;
}

double ScoringAdapter::slotWeight(const Facility& facility) const {
  if (params_.bayDistanceWeight <= 0.0) return params_.slotDistanceWeight;
  return std::min(params_.slotDistanceWeight, params_.bayDistanceWeight / facility.slotsPerBay);
}

double ScoringAdapter::scoreCell(const CellPreference& pref, const Cell& cell, const Facility& facility) const {
  return pref.suitability - params_.bayDistanceWeight * std::abs(cell.bay - pref.bay) -
         slotWeight(facility) * std::abs(cell.slot - pref.slot);
}

std::vector<Candidate> ScoringAdapter::rankCandidates(const ScoringContext& ctx, const Facility& facility) const {
  const int capacity = facility.capacity();
  std::vector<Candidate> all;
  all.reserve(static_cast<std::size_t>(capacity));
  for (int a = 0; a < capacity; ++a) {
    const Cell c = facility.cellFromAction(a);
    all.push_back(Candidate{c, scoreCell(ctx.pref, c, facility)});
  }

  // Action ids are bay-major, so comparing them is the (bay, slot) tie-break.
  auto better = [&](const Candidate& a, const Candidate& b) {
    if (a.score != b.score) return a.score > b.score;
    return facility.actionId(a.cell) < facility.actionId(b.cell);
  };

  const int k = params_.candidateCount;
  if (k > 0 && k < capacity) {
    std::partial_sort(all.begin(), all.begin() + k, all.end(), better);
    all.resize(static_cast<std::size_t>(k));
  } else {
    std::sort(all.begin(), all.end(), better);
  }
  return all;
}

bool ScoringAdapter::rankCandidates(const VehicleRequest& request, const OccupancyGrid& grid,
                                    std::vector<Candidate>& out, AllocError* outError) const {
  ScoringContext ctx;
  if (!evaluate(request, grid, ctx, outError)) return false;
  out = rankCandidates(ctx, grid.facility());
  return true;
}

double ScoringAdapter::value(int state, int action) const {
  if (values_.empty()) return 0.0;
  if (state < 0 || state >= values_.stateCount() || action < 0 || action >= values_.actionCount()) return 0.0;
  return values_.at(state, action);
}

int ScoringAdapter::stateFor(const VehicleRequest& request, const OccupancyGrid& grid) const {
  return values_.discretize(grid.occupancyRatio(), request.hourOfDay);
}

} // namespace parkwise::alloc
