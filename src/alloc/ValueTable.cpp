#include "parkwise/alloc/ValueTable.h"

#include "parkwise/core/Assert.h"
#include "parkwise/core/Log.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace parkwise::alloc {

ValueTable::ValueTable(int occupancyBuckets, int hourBuckets, int actionCount, double initial)
  : occupancyBuckets_(occupancyBuckets), hourBuckets_(hourBuckets), actionCount_(actionCount) {
  PARKWISE_ASSERT(occupancyBuckets >= 1 && hourBuckets >= 1 && actionCount >= 1);
  q_.assign(static_cast<std::size_t>(stateCount()) * static_cast<std::size_t>(actionCount_), initial);
}

int ValueTable::discretize(double occupancyRatio, int hourOfDay) const {
  if (empty()) return 0;
  const double r = std::isfinite(occupancyRatio) ? std::clamp(occupancyRatio, 0.0, 1.0) : 0.0;
  const int occ = std::min(occupancyBuckets_ - 1, static_cast<int>(std::floor(r * occupancyBuckets_)));
  const int hour = std::clamp(hourOfDay, 0, 23) * hourBuckets_ / 24;
  return occ * hourBuckets_ + hour;
}

double ValueTable::at(int state, int action) const {
  PARKWISE_ASSERT(state >= 0 && state < stateCount() && action >= 0 && action < actionCount_);
  return q_[static_cast<std::size_t>(state) * actionCount_ + action];
}

void ValueTable::set(int state, int action, double value) {
  PARKWISE_ASSERT(state >= 0 && state < stateCount() && action >= 0 && action < actionCount_);
  q_[static_cast<std::size_t>(state) * actionCount_ + action] = value;
}

void ValueTable::fill(double value) {
  std::fill(q_.begin(), q_.end(), value);
}

bool loadValueTable(const std::string& path, ValueTable& out, AllocError* outError) {
  std::ifstream f(path);
  if (!f) {
    PARKWISE_LOG_ERROR("ValueTable: failed to open " + path);
    return fail(outError, ErrorCode::Io, "cannot open value table: " + path);
  }

  std::string header;
  int version = 0;
  if (!(f >> header >> version) || header != "ParkwiseQTable" || version != 1) {
    return fail(outError, ErrorCode::Io, path + ": expected 'ParkwiseQTable 1' header");
  }

  std::string key;
  int ob = 0, hb = 0, ac = 0;
  if (!(f >> key >> ob >> hb >> ac) || key != "shape" || ob < 1 || hb < 1 || ac < 1) {
    return fail(outError, ErrorCode::Io, path + ": bad or missing 'shape' line");
  }

  ValueTable table(ob, hb, ac);
  while (f >> key) {
    if (key != "row") {
      return fail(outError, ErrorCode::Io, path + ": unexpected token '" + key + "'");
    }
    int state = -1;
    if (!(f >> state) || state < 0 || state >= table.stateCount()) {
      return fail(outError, ErrorCode::Io, path + ": row index out of range");
    }
    for (int a = 0; a < ac; ++a) {
      double v = 0.0;
      if (!(f >> v) || !std::isfinite(v)) {
        std::ostringstream oss;
        oss << path << ": row " << state << " has a missing or non-finite value at action " << a;
        return fail(outError, ErrorCode::Io, oss.str());
      }
      table.set(state, a, v);
    }
  }

  out = std::move(table);
  return true;
}

bool saveValueTable(const ValueTable& table, const std::string& path, AllocError* outError) {
  if (table.empty()) return fail(outError, ErrorCode::BadConfig, "refusing to save an empty value table");

  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    PARKWISE_LOG_ERROR("ValueTable: failed to open for writing: " + path);
    return fail(outError, ErrorCode::Io, "cannot write value table: " + path);
  }

  f.precision(17);
  f << "ParkwiseQTable 1\n";
  f << "shape " << table.occupancyBuckets() << " " << table.hourBuckets() << " " << table.actionCount() << "\n";
  for (int s = 0; s < table.stateCount(); ++s) {
    f << "row " << s;
    for (int a = 0; a < table.actionCount(); ++a) f << " " << table.at(s, a);
    f << "\n";
  }
  return static_cast<bool>(f) || fail(outError, ErrorCode::Io, "write failed: " + path);
}

} // namespace parkwise::alloc
