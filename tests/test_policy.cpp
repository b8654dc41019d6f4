#include "parkwise/alloc/Policy.h"

#include "test_fixtures.h"
#include "test_harness.h"

#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace parkwise;

static alloc::Reservation hold(const char* id) {
  alloc::Reservation r;
  r.vehicleId = id;
  r.arrivalTime = 0;
  r.departureTime = 1;
  return r;
}

int test_policy() {
  int failures = 0;

  const alloc::Facility facility{2, 3};
  const auto req = testing::hourRequest("p-1", testing::baseTime());

  // ---- Kind names ----
  {
    alloc::PolicyKind k{};
    CHECK(alloc::parsePolicyKind("algorithm", k) && k == alloc::PolicyKind::Learned);
    CHECK(alloc::parsePolicyKind("Learned", k) && k == alloc::PolicyKind::Learned);
    CHECK(alloc::parsePolicyKind("SEQUENTIAL", k) && k == alloc::PolicyKind::Sequential);
    CHECK(alloc::parsePolicyKind("random", k) && k == alloc::PolicyKind::Random);
    CHECK(!alloc::parsePolicyKind("greedy", k));
    CHECK(std::string(alloc::toString(alloc::PolicyKind::Sequential)) == "sequential");
  }

  // ---- Sequential ----
  {
    alloc::OccupancyGrid g(facility);
    CHECK(g.occupy(0, 0, hold("x")));
    alloc::Policy p = alloc::SequentialPolicy{};
    alloc::AllocationDecision d;
    alloc::AllocError err;
    CHECK(alloc::decide(p, req, g, d, &err));
    CHECK(d.allocated());
    CHECK(d.cell == (alloc::Cell{0, 1}));
    CHECK(d.bayAssigned == 1 && d.slotAssigned == 2);
    CHECK(nearly(d.score, alloc::kSequentialScore));
    CHECK(d.decisionTime == req.arrivalTime);
    // decide() never writes.
    CHECK(g.isFree(0, 1));
    CHECK(g.occupiedCount() == 1);
  }

  // ---- Invalid window ----
  {
    alloc::OccupancyGrid g(facility);
    auto bad = req;
    bad.departureTime = bad.arrivalTime;
    alloc::Policy p = alloc::SequentialPolicy{};
    alloc::AllocationDecision d;
    alloc::AllocError err;
    CHECK(!alloc::decide(p, bad, g, d, &err));
    CHECK(err.code == alloc::ErrorCode::InvalidRequest);
  }

  // ---- Full grid => Rejected, for every policy ----
  {
    alloc::OccupancyGrid g(facility);
    g.reset(1.0, 3);
    const alloc::ScoringAdapter s(alloc::constantScoring(1.0), alloc::ValueTable{});
    std::vector<alloc::Policy> all = {alloc::LearnedPolicy{&s, 0.5}, alloc::SequentialPolicy{}, alloc::RandomPolicy{}};
    for (auto& p : all) {
      alloc::AllocationDecision d;
      alloc::AllocError err;
      CHECK(alloc::decide(p, req, g, d, &err));
      CHECK(d.status == alloc::DecisionStatus::Rejected);
      CHECK(d.decisionTime == req.arrivalTime);
    }
  }

  // ---- Random: only free cells, reproducible by seed ----
  {
    alloc::OccupancyGrid g(facility);
    CHECK(g.occupy(0, 1, hold("x")));
    CHECK(g.occupy(1, 2, hold("y")));

    alloc::Policy a = alloc::RandomPolicy{core::SplitMix64(7)};
    alloc::Policy b = alloc::RandomPolicy{core::SplitMix64(7)};
    std::set<int> seen;
    for (int i = 0; i < 64; ++i) {
      alloc::AllocationDecision da, db;
      CHECK(alloc::decide(a, req, g, da));
      CHECK(alloc::decide(b, req, g, db));
      CHECK(da.cell == db.cell);
      CHECK(g.isFree(da.cell));
      CHECK(nearly(da.score, alloc::kRandomScore));
      seen.insert(facility.actionId(da.cell));
    }
    // 64 draws over 4 free cells reach all of them.
    CHECK(seen.size() == 4);
  }

  // ---- Learned ----
  {
    alloc::ScoringParams params;
    params.candidateCount = 2;
    alloc::ValueTable q(10, 4, facility.capacity());
    const alloc::ScoringAdapter s(alloc::constantScoring(1.0, 1, 1), q, params);

    // Preferred cell free: picked.
    {
      alloc::OccupancyGrid g(facility);
      alloc::Policy p = alloc::LearnedPolicy{&s, 0.5};
      alloc::AllocationDecision d;
      CHECK(alloc::decide(p, req, g, d));
      CHECK(d.cell == (alloc::Cell{1, 1}));
      CHECK(nearly(d.score, 1.0));
    }

    // Ranked candidates (1,1) and (1,0) taken: exhaustive scan still allocates.
    {
      alloc::OccupancyGrid g(facility);
      CHECK(g.occupy(1, 1, hold("a")));
      CHECK(g.occupy(1, 0, hold("b")));
      alloc::Policy p = alloc::LearnedPolicy{&s, 0.5};
      alloc::AllocationDecision d;
      CHECK(alloc::decide(p, req, g, d));
      CHECK(d.allocated());
      CHECK(d.cell == (alloc::Cell{1, 2}));
    }

    // The value table steers the choice.
    {
      alloc::ValueTable boosted(10, 4, facility.capacity());
      const int state = boosted.discretize(0.0, req.hourOfDay);
      boosted.set(state, facility.actionId(alloc::Cell{1, 0}), 1.0);
      alloc::ScoringParams wide;
      wide.candidateCount = 0;
      const alloc::ScoringAdapter sq(alloc::constantScoring(1.0, 1, 1), boosted, wide);

      alloc::OccupancyGrid g(facility);
      alloc::Policy p = alloc::LearnedPolicy{&sq, 0.5};
      alloc::AllocationDecision d;
      CHECK(alloc::decide(p, req, g, d));
      CHECK(d.cell == (alloc::Cell{1, 0}));
      CHECK(nearly(d.score, 1.0 - 0.01 + 0.5));

      // Blend weight 0 ignores the table.
      alloc::Policy p0 = alloc::LearnedPolicy{&sq, 0.0};
      CHECK(alloc::decide(p0, req, g, d));
      CHECK(d.cell == (alloc::Cell{1, 1}));
    }

    // Scoring failure surfaces as ScoringFailed; a missing adapter too.
    {
      alloc::OccupancyGrid g(facility);
      const alloc::ScoringAdapter broken(alloc::constantScoring(std::numeric_limits<double>::quiet_NaN()),
                                         alloc::ValueTable{});
      alloc::Policy p = alloc::LearnedPolicy{&broken, 0.5};
      alloc::AllocationDecision d;
      alloc::AllocError err;
      CHECK(!alloc::decide(p, req, g, d, &err));
      CHECK(err.code == alloc::ErrorCode::ScoringFailed);

      alloc::Policy unset = alloc::LearnedPolicy{};
      CHECK(!alloc::decide(unset, req, g, d, &err));
      CHECK(err.code == alloc::ErrorCode::ScoringFailed);
    }

    // Exceptions from the scoring callbacks propagate out of decide().
    {
      alloc::ScoringFunctions f = alloc::constantScoring(1.0);
      f.suitability = [](const alloc::FeatureVector&) -> double { throw std::runtime_error("model offline"); };
      const alloc::ScoringAdapter throwing(f, alloc::ValueTable{});
      alloc::OccupancyGrid g(facility);
      alloc::Policy p = alloc::LearnedPolicy{&throwing, 0.5};
      alloc::AllocationDecision d;
      bool threw = false;
      try {
        (void)alloc::decide(p, req, g, d);
      } catch (const std::runtime_error&) {
        threw = true;
      }
      CHECK(threw);
    }
  }

  return failures;
}
