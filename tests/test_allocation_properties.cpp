#include <catch2/catch_test_macros.hpp>

#include "parkwise/alloc/OccupancyGrid.h"
#include "parkwise/alloc/Policy.h"
#include "parkwise/alloc/SimulationRunner.h"
#include "parkwise/core/Random.h"

#include "test_fixtures.h"

#include <set>
#include <vector>

using namespace parkwise;

TEST_CASE("No policy ever assigns an occupied cell") {
  const alloc::Facility facility{3, 7};
  const alloc::ScoringAdapter scoring(alloc::constantScoring(0.5, 2, 6), alloc::ValueTable{});

  for (core::u64 seed = 1; seed <= 20; ++seed) {
    std::vector<alloc::Policy> policies = {alloc::LearnedPolicy{&scoring, 0.5}, alloc::SequentialPolicy{},
                                           alloc::RandomPolicy{core::SplitMix64(seed)}};
    for (auto& policy : policies) {
      alloc::SimulationParams params;
      params.facility = facility;
      params.initialFillRatio = 0.3;
      params.fillSeed = seed;

      const auto requests = testing::hourRequests(facility.capacity());
      const auto report = alloc::runSimulation(requests, policy, params);

      // 30% pre-filled: the remaining 70% of the cells are allocated, the rest rejected.
      const int prefilled = 6;
      REQUIRE(report.successful == facility.capacity() - prefilled);
      REQUIRE(report.successful + report.failed == report.totalVehicles);

      std::set<int> cells;
      for (const auto& o : report.outcomes) {
        if (!o.success) continue;
        REQUIRE(facility.contains(o.decision.cell));
        REQUIRE(cells.insert(facility.actionId(o.decision.cell)).second);
      }
    }
  }
}

TEST_CASE("occupy then release restores the free set") {
  const alloc::Facility facility{4, 5};
  alloc::OccupancyGrid grid(facility);
  core::SplitMix64 rng(2024);

  alloc::Reservation r;
  r.vehicleId = "p";
  r.arrivalTime = 0;
  r.departureTime = 10;

  for (int step = 0; step < 500; ++step) {
    const alloc::Cell c = facility.cellFromAction(static_cast<int>(rng.nextIndex(facility.capacity())));
    const bool wasFree = grid.isFree(c);
    const int before = grid.occupiedCount();

    if (rng.chance(0.5)) {
      const bool ok = grid.occupy(c, r);
      REQUIRE(ok == wasFree);
      REQUIRE(!grid.isFree(c));
      REQUIRE(grid.occupiedCount() == before + (ok ? 1 : 0));
    } else {
      const bool ok = grid.release(c);
      REQUIRE(ok == !wasFree);
      REQUIRE(grid.isFree(c));
      REQUIRE(grid.occupiedCount() == before - (ok ? 1 : 0));
    }
    REQUIRE(grid.freeCount() == static_cast<int>(grid.freeCells().collect().size()));
  }
}

TEST_CASE("Random policy replays exactly for a given seed") {
  const alloc::Facility facility{5, 8};
  const auto requests = testing::hourRequests(35);

  alloc::SimulationParams params;
  params.facility = facility;

  alloc::Policy a = alloc::RandomPolicy{core::SplitMix64(77)};
  alloc::Policy b = alloc::RandomPolicy{core::SplitMix64(77)};
  const auto ra = alloc::runSimulation(requests, a, params);
  const auto rb = alloc::runSimulation(requests, b, params);

  REQUIRE(ra.outcomes.size() == rb.outcomes.size());
  for (std::size_t i = 0; i < ra.outcomes.size(); ++i) {
    REQUIRE(ra.outcomes[i].decision.cell == rb.outcomes[i].decision.cell);
  }
}
