#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/Facility.h"

#include <array>
#include <cstddef>
#include <functional>
#include <string>

namespace parkwise::alloc {

// Model input, fixed order. Matches the column order the external models were
// trained with.
enum FeatureIndex : std::size_t {
  Feature_DurationHours  = 0,
  Feature_DayOfWeek      = 1,
  Feature_HourOfDay      = 2,
  Feature_Priority       = 3,
  Feature_OccupancyRatio = 4,
  Feature_PlateType      = 5,
  Feature_Count          = 6
};

using FeatureVector = std::array<double, Feature_Count>;

// The three externally trained predictors. Must be pure and cheap: they are
// called on the allocation path, once per decision.
struct ScoringFunctions {
  std::function<double(const FeatureVector&)> suitability;
  std::function<int(const FeatureVector&)> bayPreference;
  std::function<int(const FeatureVector&)> slotPreference;

  bool complete() const { return suitability && bayPreference && slotPreference; }
};

// Same score and preference for every request.
ScoringFunctions constantScoring(double score, int bay = 0, int slot = 0);

struct LinearModel {
  double bias{0.0};
  FeatureVector weights{};

  double evaluate(const FeatureVector& x) const;
};

// Trained linear predictors loaded from disk.
//
//   ParkwiseModel 1
//   suitability <bias> <w0> ... <w5>
//   bay         <bias> <w0> ... <w5>
//   slot        <bias> <w0> ... <w5>
//   activation  logistic|linear        (applies to suitability; default logistic)
//
// Bay/slot outputs are rounded to the nearest index; ScoringAdapter clamps them
// into the facility.
struct LinearScoringModel {
  LinearModel suitability;
  LinearModel bay;
  LinearModel slot;
  bool logisticSuitability{true};

  ScoringFunctions toFunctions() const;
};

bool loadLinearScoringModel(const std::string& path, LinearScoringModel& out, AllocError* outError = nullptr);

} // namespace parkwise::alloc
