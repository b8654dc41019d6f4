#include "parkwise/alloc/ScoringAdapter.h"
#include "parkwise/alloc/ScoringModel.h"

#include "test_fixtures.h"
#include "test_harness.h"

#include <cstdio>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

using namespace parkwise;

static bool writeText(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) return false;
  f << content;
  return static_cast<bool>(f);
}

int test_scoring() {
  int failures = 0;

  const alloc::Facility facility{3, 4};
  const auto req = testing::hourRequest("car-1", testing::baseTime() + 3 * alloc::kSecondsPerHour, 2,
                                        alloc::PlateType::Government);

  // ---- Feature vector ----
  {
    alloc::OccupancyGrid g(facility);
    alloc::Reservation r;
    r.vehicleId = "x";
    r.arrivalTime = 0;
    r.departureTime = 10;
    CHECK(g.occupy(0, 0, r));
    CHECK(g.occupy(0, 1, r));
    CHECK(g.occupy(0, 2, r));

    const alloc::FeatureVector x = alloc::ScoringAdapter::features(req, g);
    CHECK(nearly(x[alloc::Feature_DurationHours], 2.0));
    CHECK(nearly(x[alloc::Feature_DayOfWeek], 0.0));
    CHECK(nearly(x[alloc::Feature_HourOfDay], 11.0));
    CHECK(nearly(x[alloc::Feature_Priority], 2.0));
    CHECK(nearly(x[alloc::Feature_OccupancyRatio], 0.25));
    CHECK(nearly(x[alloc::Feature_PlateType], 2.0));
  }

  // ---- Ranking follows the preferred cell ----
  {
    alloc::ScoringParams params;
    params.candidateCount = 3;
    const alloc::ScoringAdapter s(alloc::constantScoring(0.8, 1, 2), alloc::ValueTable{}, params);
    alloc::OccupancyGrid g(facility);

    std::vector<alloc::Candidate> ranked;
    alloc::AllocError err;
    CHECK(s.rankCandidates(req, g, ranked, &err));
    CHECK(ranked.size() == 3);
    if (ranked.size() == 3) {
      CHECK(ranked[0].cell == (alloc::Cell{1, 2}));
      CHECK(nearly(ranked[0].score, 0.8));
      // Slot distance is cheaper than bay distance; equal scores keep (bay, slot) order.
      CHECK(ranked[1].cell == (alloc::Cell{1, 1}));
      CHECK(ranked[2].cell == (alloc::Cell{1, 3}));
      CHECK(nearly(ranked[1].score, ranked[2].score));
    }

    // Cell score = suitability - 0.1 * |dbay| - 0.01 * |dslot|.
    const alloc::CellPreference pref{1, 2, 0.8};
    CHECK(nearly(s.scoreCell(pref, alloc::Cell{1, 2}, facility), 0.8));
    CHECK(nearly(s.scoreCell(pref, alloc::Cell{0, 0}, facility), 0.8 - 0.1 - 0.02));
    CHECK(nearly(s.scoreCell(pref, alloc::Cell{2, 3}, facility), 0.8 - 0.1 - 0.01));

    // Wide bays: the slot weight drops to 0.1 / 12 so the far end of the
    // preferred bay still beats the next bay.
    const alloc::Facility wide{2, 12};
    const alloc::CellPreference corner{0, 0, 1.0};
    CHECK(nearly(s.slotWeight(wide), 0.1 / 12.0));
    CHECK(s.scoreCell(corner, alloc::Cell{0, 11}, wide) > s.scoreCell(corner, alloc::Cell{1, 0}, wide));

    alloc::ScoringParams noBay;
    noBay.bayDistanceWeight = 0.0;
    const alloc::ScoringAdapter slotOnly(alloc::constantScoring(1.0), alloc::ValueTable{}, noBay);
    CHECK(nearly(slotOnly.slotWeight(wide), 0.01));

    // candidateCount = 0 ranks every cell, best first.
    params.candidateCount = 0;
    const alloc::ScoringAdapter all(alloc::constantScoring(0.8, 1, 2), alloc::ValueTable{}, params);
    CHECK(all.rankCandidates(req, g, ranked, &err));
    CHECK(ranked.size() == 12);
    for (std::size_t i = 1; i < ranked.size(); ++i) CHECK(ranked[i - 1].score >= ranked[i].score);

    // Out-of-range preferences are clamped into the facility.
    const alloc::ScoringAdapter far(alloc::constantScoring(1.0, 50, -3), alloc::ValueTable{}, params);
    alloc::ScoringContext ctx;
    CHECK(far.evaluate(req, g, ctx, &err));
    CHECK(ctx.pref.bay == 2);
    CHECK(ctx.pref.slot == 0);
    CHECK(far.rankCandidates(ctx, facility)[0].cell == (alloc::Cell{2, 0}));
  }

  // ---- Failures ----
  {
    alloc::OccupancyGrid g(facility);
    std::vector<alloc::Candidate> ranked;
    alloc::AllocError err;

    const alloc::ScoringAdapter nan(alloc::constantScoring(std::numeric_limits<double>::quiet_NaN()),
                                    alloc::ValueTable{});
    CHECK(!nan.rankCandidates(req, g, ranked, &err));
    CHECK(err.code == alloc::ErrorCode::ScoringFailed);

    const alloc::ScoringAdapter inf(alloc::constantScoring(std::numeric_limits<double>::infinity()),
                                    alloc::ValueTable{});
    CHECK(!inf.rankCandidates(req, g, ranked, &err));

    alloc::ScoringFunctions partial = alloc::constantScoring(1.0);
    partial.slotPreference = nullptr;
    const alloc::ScoringAdapter missing(partial, alloc::ValueTable{});
    CHECK(!missing.rankCandidates(req, g, ranked, &err));
    CHECK(err.code == alloc::ErrorCode::ScoringFailed);
  }

  // ---- Value lookups ----
  {
    alloc::ValueTable q(10, 4, facility.capacity());
    q.set(0, 5, 3.0);
    const alloc::ScoringAdapter s(alloc::constantScoring(1.0), q);
    CHECK(nearly(s.value(0, 5), 3.0));
    CHECK(nearly(s.value(0, 99), 0.0));

    alloc::OccupancyGrid g(facility);
    // 11:00 falls in the second 6-hour bucket.
    CHECK(s.stateFor(req, g) == 1);

    const alloc::ScoringAdapter none(alloc::constantScoring(1.0), alloc::ValueTable{});
    CHECK(nearly(none.value(0, 5), 0.0));
  }

  // ---- Linear model file ----
  {
    const std::string path = "parkwise_test_model.txt";
    CHECK(writeText(path,
                    "ParkwiseModel 1\n"
                    "# bias then weights: duration day hour priority occupancy plate\n"
                    "suitability 0 0 0 0 0 -2 0\n"
                    "bay 0.4 0 0 0 1 0 0\n"
                    "slot 3 0 0 0 0 0 0\n"
                    "activation linear\n"));

    alloc::LinearScoringModel m;
    alloc::AllocError err;
    CHECK(alloc::loadLinearScoringModel(path, m, &err));
    CHECK(!m.logisticSuitability);

    const alloc::ScoringFunctions f = m.toFunctions();
    CHECK(f.complete());
    alloc::FeatureVector x{};
    x[alloc::Feature_Priority] = 2.0;
    x[alloc::Feature_OccupancyRatio] = 0.5;
    CHECK(nearly(f.suitability(x), -1.0));
    CHECK(f.bayPreference(x) == 2);
    CHECK(f.slotPreference(x) == 3);

    m.logisticSuitability = true;
    x[alloc::Feature_OccupancyRatio] = 0.0;
    CHECK(nearly(m.toFunctions().suitability(x), 0.5));

    CHECK(writeText(path, "ParkwiseModel 1\nsuitability 0 0 0 0 0 0 0\nbay 0 0 0 0 0 0 0\n"));
    CHECK(!alloc::loadLinearScoringModel(path, m, &err));
    CHECK(err.code == alloc::ErrorCode::Io);

    CHECK(writeText(path, "ParkwiseModel 1\nsuitability 0 0 0\n"));
    CHECK(!alloc::loadLinearScoringModel(path, m, &err));

    CHECK(writeText(path, "ParkwiseModel 2\n"));
    CHECK(!alloc::loadLinearScoringModel(path, m, &err));

    std::remove(path.c_str());
  }

  return failures;
}
