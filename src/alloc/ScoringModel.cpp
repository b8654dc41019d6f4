#include "parkwise/alloc/ScoringModel.h"

#include "parkwise/core/Log.h"

#include <cmath>
#include <fstream>
#include <sstream>

namespace parkwise::alloc {

ScoringFunctions constantScoring(double score, int bay, int slot) {
  ScoringFunctions f;
  f.suitability = [score](const FeatureVector&) { return score; };
  f.bayPreference = [bay](const FeatureVector&) { return bay; };
  f.slotPreference = [slot](const FeatureVector&) { return slot; };
  return f;
}

double LinearModel::evaluate(const FeatureVector& x) const {
  double z = bias;
  for (std::size_t i = 0; i < x.size(); ++i) z += weights[i] * x[i];
  return z;
}

ScoringFunctions LinearScoringModel::toFunctions() const {
  ScoringFunctions f;
  const LinearModel s = suitability;
  const bool logistic = logisticSuitability;
  f.suitability = [s, logistic](const FeatureVector& x) {
    const double z = s.evaluate(x);
    return logistic ? 1.0 / (1.0 + std::exp(-z)) : z;
  };
  const LinearModel b = bay;
  f.bayPreference = [b](const FeatureVector& x) { return static_cast<int>(std::lround(b.evaluate(x))); };
  const LinearModel sl = slot;
  f.slotPreference = [sl](const FeatureVector& x) { return static_cast<int>(std::lround(sl.evaluate(x))); };
  return f;
}

static bool readModelRow(std::istream& in, LinearModel& m) {
  if (!(in >> m.bias)) return false;
  for (double& w : m.weights) {
    if (!(in >> w)) return false;
  }
  return std::isfinite(m.bias);
}

bool loadLinearScoringModel(const std::string& path, LinearScoringModel& out, AllocError* outError) {
  std::ifstream f(path);
  if (!f) {
    PARKWISE_LOG_ERROR("ScoringModel: failed to open " + path);
    return fail(outError, ErrorCode::Io, "cannot open scoring model: " + path);
  }

  std::string header;
  int version = 0;
  if (!(f >> header >> version) || header != "ParkwiseModel" || version != 1) {
    return fail(outError, ErrorCode::Io, path + ": expected 'ParkwiseModel 1' header");
  }

  LinearScoringModel m;
  bool haveSuit = false, haveBay = false, haveSlot = false;

  std::string key;
  while (f >> key) {
    if (key == "suitability") {
      haveSuit = readModelRow(f, m.suitability);
      if (!haveSuit) return fail(outError, ErrorCode::Io, path + ": malformed 'suitability' row");
    } else if (key == "bay") {
      haveBay = readModelRow(f, m.bay);
      if (!haveBay) return fail(outError, ErrorCode::Io, path + ": malformed 'bay' row");
    } else if (key == "slot") {
      haveSlot = readModelRow(f, m.slot);
      if (!haveSlot) return fail(outError, ErrorCode::Io, path + ": malformed 'slot' row");
    } else if (key == "activation") {
      std::string act;
      f >> act;
      if (act == "logistic") {
        m.logisticSuitability = true;
      } else if (act == "linear") {
        m.logisticSuitability = false;
      } else {
        return fail(outError, ErrorCode::Io, path + ": unknown activation '" + act + "'");
      }
    } else if (!key.empty() && key[0] == '#') {
      std::string rest;
      std::getline(f, rest);
    } else {
      return fail(outError, ErrorCode::Io, path + ": unexpected token '" + key + "'");
    }
  }

  if (!haveSuit || !haveBay || !haveSlot) {
    return fail(outError, ErrorCode::Io, path + ": needs suitability, bay and slot rows");
  }

  out = m;
  return true;
}

} // namespace parkwise::alloc
