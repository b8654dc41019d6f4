#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/OccupancyGrid.h"
#include "parkwise/alloc/ScoringModel.h"
#include "parkwise/alloc/ValueTable.h"
#include "parkwise/alloc/VehicleRequest.h"

#include <vector>

namespace parkwise::alloc {

struct ScoringParams {
  // Number of ranked cells handed to the learned policy. 0 = every cell.
  int candidateCount{5};
  double bayDistanceWeight{0.1};
  double slotDistanceWeight{0.01};
};

struct Candidate {
  Cell cell{};
  double score{0.0};
};

// Model outputs for one request, preferences already clamped into the facility.
struct CellPreference {
  int bay{0};
  int slot{0};
  double suitability{0.0};
};

// Everything derived from one (request, grid) pair. Computed once per decision.
struct ScoringContext {
  FeatureVector features{};
  CellPreference pref{};
  int state{0};
};

// Turns a request plus the current grid into ranked candidate cells.
//
// Immutable after construction and safe to share between threads, provided the
// wrapped scoring functions are themselves pure.
class ScoringAdapter {
public:
  ScoringAdapter() = default;
  ScoringAdapter(ScoringFunctions functions, ValueTable values, ScoringParams params = {});

  const ScoringParams& params() const { return params_; }
  const ValueTable& valueTable() const { return values_; }

  static FeatureVector features(const VehicleRequest& request, const OccupancyGrid& grid);

  // Runs the three scoring functions. Fails with ScoringFailed when a function
  // is missing or the suitability is not finite.
  bool evaluate(const VehicleRequest& request, const OccupancyGrid& grid, ScoringContext& out,
                AllocError* outError = nullptr) const;

  // suitability - bayWeight * |dbay| - slotWeight * |dslot|. The slot weight is
  // capped at bayDistanceWeight / slotsPerBay, so one bay step always outweighs
  // any slot difference within a bay.
  double scoreCell(const CellPreference& pref, const Cell& cell, const Facility& facility) const;
  double slotWeight(const Facility& facility) const;

  // Every cell of the facility (free or not), highest score first, ties by
  // ascending (bay, slot); truncated to candidateCount.
  std::vector<Candidate> rankCandidates(const ScoringContext& ctx, const Facility& facility) const;

  bool rankCandidates(const VehicleRequest& request, const OccupancyGrid& grid, std::vector<Candidate>& out,
                      AllocError* outError = nullptr) const;

  // 0 when no value table was supplied.
  double value(int state, int action) const;
  int stateFor(const VehicleRequest& request, const OccupancyGrid& grid) const;

private:
  ScoringFunctions functions_;
  ValueTable values_;
  ScoringParams params_{};
};

} // namespace parkwise::alloc
