#pragma once

#include "parkwise/alloc/AllocError.h"

#include <string>
#include <vector>

namespace parkwise::alloc {

// Pre-trained state-action values Q[state][action], consulted (never updated)
// by the learned policy.
//
// State = occupancy bucket x hour-of-day bucket:
//   occ   = min(occupancyBuckets - 1, floor(ratio * occupancyBuckets))
//   hour  = hourOfDay * hourBuckets / 24
//   state = occ * hourBuckets + hour
// Action = Facility::actionId(cell).
//
// A default-constructed table is empty and contributes 0 to every score.
class ValueTable {
public:
  ValueTable() = default;
  ValueTable(int occupancyBuckets, int hourBuckets, int actionCount, double initial = 0.0);

  bool empty() const { return q_.empty(); }

  int occupancyBuckets() const { return occupancyBuckets_; }
  int hourBuckets() const { return hourBuckets_; }
  int stateCount() const { return occupancyBuckets_ * hourBuckets_; }
  int actionCount() const { return actionCount_; }

  int discretize(double occupancyRatio, int hourOfDay) const;

  // Indices must be in range (checked).
  double at(int state, int action) const;
  void set(int state, int action, double value);
  void fill(double value);

  const std::vector<double>& values() const { return q_; }

private:
  int occupancyBuckets_{0};
  int hourBuckets_{0};
  int actionCount_{0};
  std::vector<double> q_;
};

// Text format:
//   ParkwiseQTable 1
//   shape <occupancyBuckets> <hourBuckets> <actionCount>
//   row <state> <v0> <v1> ... <v(actionCount-1)>
// Rows that are not listed stay 0.
bool loadValueTable(const std::string& path, ValueTable& out, AllocError* outError = nullptr);
bool saveValueTable(const ValueTable& table, const std::string& path, AllocError* outError = nullptr);

} // namespace parkwise::alloc
