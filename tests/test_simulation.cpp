#include "parkwise/alloc/EngineConfig.h"
#include "parkwise/alloc/PolicyComparison.h"
#include "parkwise/alloc/SimulationRunner.h"
#include "parkwise/core/JobSystem.h"

#include "test_fixtures.h"
#include "test_harness.h"

#include <limits>
#include <set>
#include <stdexcept>
#include <vector>

using namespace parkwise;

static alloc::SimulationParams paramsFor(const alloc::Facility& f) {
  alloc::SimulationParams p;
  p.facility = f;
  return p;
}

int test_simulation() {
  int failures = 0;

  // ---- 2x2 facility, five one-hour requests, sequential ----
  {
    const auto requests = testing::hourRequests(5);
    alloc::Policy p = alloc::SequentialPolicy{};
    const alloc::SimulationReport r = alloc::runSimulation(requests, p, paramsFor(alloc::Facility{2, 2}));

    CHECK(r.policy == alloc::PolicyKind::Sequential);
    CHECK(r.totalVehicles == 5);
    CHECK(r.successful == 4);
    CHECK(r.failed == 1);
    CHECK(nearly(r.successRate, 0.8));
    CHECK(nearly(r.averageScore, 1.0));
    CHECK(r.totalProcessingSeconds >= 0.0);
    CHECK(r.outcomes.size() == 5);
    if (r.outcomes.size() == 5) {
      CHECK(r.outcomes[0].decision.cell == (alloc::Cell{0, 0}));
      CHECK(r.outcomes[1].decision.cell == (alloc::Cell{0, 1}));
      CHECK(r.outcomes[2].decision.cell == (alloc::Cell{1, 0}));
      CHECK(r.outcomes[3].decision.cell == (alloc::Cell{1, 1}));
      CHECK(r.outcomes[0].decision.bayAssigned == 1 && r.outcomes[0].decision.slotAssigned == 1);
      CHECK(r.outcomes[3].decision.bayAssigned == 2 && r.outcomes[3].decision.slotAssigned == 2);
      CHECK(!r.outcomes[4].success);
      CHECK(r.outcomes[4].error == alloc::ErrorCode::CapacityExhausted);
      CHECK(r.outcomes[4].message == "capacity exhausted");
      CHECK(r.outcomes[4].decision.status == alloc::DecisionStatus::Rejected);
      for (std::size_t i = 0; i < 5; ++i) CHECK(r.outcomes[i].vehicleId == requests[i].vehicleId);
    }
    CHECK(r.finalGrid.cells.size() == 4);
    for (const auto& c : r.finalGrid.cells) CHECK(c.has_value());
  }

  // ---- Sequential never double-books within capacity ----
  {
    const alloc::Facility f{3, 5};
    const auto requests = testing::hourRequests(f.capacity());
    alloc::Policy p = alloc::SequentialPolicy{};
    const auto r = alloc::runSimulation(requests, p, paramsFor(f));
    CHECK(r.successful == f.capacity());
    std::set<int> cells;
    for (const auto& o : r.outcomes) cells.insert(f.actionId(o.decision.cell));
    CHECK((int)cells.size() == f.capacity());
  }

  // ---- Capacity boundary: capacity + 1 requests ----
  {
    const alloc::Facility f{2, 3};
    const auto requests = testing::hourRequests(f.capacity() + 1);
    const alloc::ScoringAdapter s(alloc::constantScoring(0.7, 1, 2), alloc::ValueTable{});
    std::vector<alloc::Policy> all = {alloc::LearnedPolicy{&s, 0.5}, alloc::SequentialPolicy{},
                                      alloc::RandomPolicy{core::SplitMix64(11)}};
    for (auto& p : all) {
      const auto r = alloc::runSimulation(requests, p, paramsFor(f));
      CHECK(r.successful == f.capacity());
      CHECK(r.failed == 1);
      CHECK(!r.outcomes.back().success);
      CHECK(r.outcomes.back().error == alloc::ErrorCode::CapacityExhausted);
      CHECK(r.successful + r.failed == r.totalVehicles);
    }
  }

  // ---- Learned with constant scores and a constant table == sequential ----
  {
    const alloc::Facility f{3, 4};
    const auto requests = testing::hourRequests(14);
    alloc::ValueTable q(10, 4, f.capacity(), 0.25);
    const alloc::ScoringAdapter s(alloc::constantScoring(1.0), q);

    alloc::Policy learned = alloc::LearnedPolicy{&s, 0.5};
    alloc::Policy sequential = alloc::SequentialPolicy{};
    const auto a = alloc::runSimulation(requests, learned, paramsFor(f));
    const auto b = alloc::runSimulation(requests, sequential, paramsFor(f));
    CHECK(a.successful == b.successful);
    CHECK(a.outcomes.size() == b.outcomes.size());
    for (std::size_t i = 0; i < a.outcomes.size() && i < b.outcomes.size(); ++i) {
      CHECK(a.outcomes[i].success == b.outcomes[i].success);
      if (a.outcomes[i].success && b.outcomes[i].success) CHECK(a.outcomes[i].decision.cell == b.outcomes[i].decision.cell);
    }
  }

  // ---- Same equivalence on bays wider than bayDistanceWeight / slotDistanceWeight ----
  {
    const alloc::Facility f{2, 12};
    const auto requests = testing::hourRequests(f.capacity());
    alloc::ValueTable q(10, 4, f.capacity(), 0.25);
    const alloc::ScoringAdapter s(alloc::constantScoring(1.0), q);

    alloc::Policy learned = alloc::LearnedPolicy{&s, 0.5};
    alloc::Policy sequential = alloc::SequentialPolicy{};
    const auto a = alloc::runSimulation(requests, learned, paramsFor(f));
    const auto b = alloc::runSimulation(requests, sequential, paramsFor(f));
    CHECK(a.successful == f.capacity());
    CHECK(b.successful == f.capacity());
    int mismatches = 0;
    for (std::size_t i = 0; i < a.outcomes.size() && i < b.outcomes.size(); ++i) {
      if (!(a.outcomes[i].decision.cell == b.outcomes[i].decision.cell)) ++mismatches;
    }
    CHECK(mismatches == 0);
    CHECK(a.outcomes[11].decision.cell == (alloc::Cell{0, 11}));
    CHECK(a.outcomes[12].decision.cell == (alloc::Cell{1, 0}));
  }

  // ---- Random reproducibility ----
  {
    const alloc::Facility f{4, 10};
    const auto requests = testing::hourRequests(30);
    alloc::Policy a = alloc::RandomPolicy{core::SplitMix64(42)};
    alloc::Policy b = alloc::RandomPolicy{core::SplitMix64(42)};
    const auto ra = alloc::runSimulation(requests, a, paramsFor(f));
    const auto rb = alloc::runSimulation(requests, b, paramsFor(f));
    CHECK(ra.successful == 30);
    for (std::size_t i = 0; i < ra.outcomes.size(); ++i) CHECK(ra.outcomes[i].decision.cell == rb.outcomes[i].decision.cell);
  }

  // ---- Per-request failures never abort the batch ----
  {
    const alloc::Facility f{1, 4};
    auto requests = testing::hourRequests(4);
    requests[1].departureTime = requests[1].arrivalTime - 60;

    int calls = 0;
    alloc::ScoringFunctions fn = alloc::constantScoring(1.0);
    fn.suitability = [&calls](const alloc::FeatureVector&) -> double {
      if (++calls == 2) throw std::runtime_error("model offline");
      return 1.0;
    };
    const alloc::ScoringAdapter s(fn, alloc::ValueTable{});
    alloc::Policy p = alloc::LearnedPolicy{&s, 0.0};

    const auto r = alloc::runSimulation(requests, p, paramsFor(f));
    CHECK(r.outcomes.size() == 4);
    CHECK(r.successful == 2);
    CHECK(r.failed == 2);
    if (r.outcomes.size() == 4) {
      CHECK(r.outcomes[0].success);
      CHECK(r.outcomes[1].error == alloc::ErrorCode::InvalidRequest);
      CHECK(r.outcomes[2].error == alloc::ErrorCode::ScoringFailed);
      CHECK(r.outcomes[2].message.find("model offline") != std::string::npos);
      CHECK(r.outcomes[3].success);
    }
  }

  // ---- Callbacks throwing non-std types are contained too ----
  {
    const alloc::Facility f{1, 3};
    const auto requests = testing::hourRequests(3);

    int calls = 0;
    alloc::ScoringFunctions fn = alloc::constantScoring(1.0);
    fn.suitability = [&calls](const alloc::FeatureVector&) -> double {
      ++calls;
      if (calls == 2) throw "model offline";
      if (calls == 3) throw 42;
      return 1.0;
    };
    const alloc::ScoringAdapter s(fn, alloc::ValueTable{});
    alloc::Policy p = alloc::LearnedPolicy{&s, 0.0};

    const auto r = alloc::runSimulation(requests, p, paramsFor(f));
    CHECK(r.outcomes.size() == 3);
    CHECK(r.successful == 1);
    CHECK(r.failed == 2);
    if (r.outcomes.size() == 3) {
      CHECK(r.outcomes[0].success);
      CHECK(r.outcomes[1].error == alloc::ErrorCode::ScoringFailed);
      CHECK(r.outcomes[1].message == "scoring threw a non-standard exception");
      CHECK(r.outcomes[2].error == alloc::ErrorCode::ScoringFailed);
    }
  }

  // ---- Aggregates with nothing allocated ----
  {
    alloc::Policy p = alloc::SequentialPolicy{};
    const auto empty = alloc::runSimulation({}, p, paramsFor(alloc::Facility{1, 1}));
    CHECK(empty.totalVehicles == 0);
    CHECK(nearly(empty.successRate, 0.0));
    CHECK(nearly(empty.averageScore, 0.0));

    alloc::SimulationParams full = paramsFor(alloc::Facility{1, 2});
    full.initialFillRatio = 1.0;
    const auto none = alloc::runSimulation(testing::hourRequests(3), p, full);
    CHECK(none.successful == 0);
    CHECK(none.failed == 3);
    CHECK(nearly(none.averageScore, 0.0));
  }

  // ---- Average over successes only ----
  {
    const alloc::Facility f{1, 2};
    const auto requests = testing::hourRequests(3);
    const alloc::ScoringAdapter s(alloc::constantScoring(0.6, 0, 0), alloc::ValueTable{});
    alloc::Policy p = alloc::LearnedPolicy{&s, 0.5};
    const auto r = alloc::runSimulation(requests, p, paramsFor(f));
    CHECK(r.successful == 2);
    // (0.6 + (0.6 - 0.01)) / 2
    CHECK(nearly(r.averageScore, 0.595));
  }

  // ---- Pre-fill and release-on-departure ----
  {
    const alloc::Facility f{1, 2};
    const alloc::EpochSec t0 = testing::baseTime();
    std::vector<alloc::VehicleRequest> requests = {
      testing::hourRequest("a", t0), testing::hourRequest("b", t0),
      testing::hourRequest("c", t0 + 2 * alloc::kSecondsPerHour)};

    alloc::Policy p = alloc::SequentialPolicy{};
    alloc::SimulationParams held = paramsFor(f);
    CHECK(alloc::runSimulation(requests, p, held).successful == 2);

    alloc::SimulationParams releasing = held;
    releasing.releaseOnDeparture = true;
    const auto r = alloc::runSimulation(requests, p, releasing);
    CHECK(r.successful == 3);
    CHECK(r.outcomes[2].decision.cell == (alloc::Cell{0, 0}));

    alloc::SimulationParams half = paramsFor(alloc::Facility{2, 5});
    half.initialFillRatio = 0.5;
    const auto hr = alloc::runSimulation(testing::hourRequests(6), p, half);
    CHECK(hr.successful == 5);
  }

  // ---- comparePolicies ----
  {
    alloc::EngineConfig config;
    config.facility = alloc::Facility{2, 3};
    const alloc::ScoringAdapter s(alloc::constantScoring(1.0), alloc::makeValueTable(config), config.scoring);
    const auto requests = testing::hourRequests(8);

    std::vector<alloc::SimulationReport> serial, parallel;
    alloc::AllocError err;
    CHECK(alloc::comparePolicies(requests, config, &s, serial, &err));
    core::JobSystem jobs(3);
    CHECK(alloc::comparePolicies(requests, config, &s, parallel, &err, &jobs));

    CHECK(serial.size() == 3);
    CHECK(parallel.size() == 3);
    if (serial.size() == 3 && parallel.size() == 3) {
      CHECK(serial[0].policy == alloc::PolicyKind::Learned);
      CHECK(serial[1].policy == alloc::PolicyKind::Sequential);
      CHECK(serial[2].policy == alloc::PolicyKind::Random);
      for (std::size_t i = 0; i < 3; ++i) {
        CHECK(serial[i].successful == 6);
        CHECK(parallel[i].policy == serial[i].policy);
        CHECK(parallel[i].successful == serial[i].successful);
        for (std::size_t k = 0; k < serial[i].outcomes.size(); ++k) {
          CHECK(parallel[i].outcomes[k].decision.cell == serial[i].outcomes[k].decision.cell);
        }
      }
    }

    std::vector<alloc::SimulationReport> untouched;
    CHECK(!alloc::comparePolicies(requests, config, nullptr, untouched, &err));
    CHECK(err.code == alloc::ErrorCode::BadConfig);
    CHECK(untouched.empty());
  }

  return failures;
}
