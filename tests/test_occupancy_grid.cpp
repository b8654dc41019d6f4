#include "parkwise/alloc/OccupancyGrid.h"
#include "parkwise/core/Log.h"

#include "test_harness.h"

#include <set>
#include <string>
#include <vector>

using namespace parkwise;

static void countWarnings(core::LogLevel level, std::string_view, std::string_view, void* user) {
  if (level == core::LogLevel::Warn) ++*static_cast<int*>(user);
}

static alloc::Reservation res(const std::string& id, alloc::EpochSec arrival, alloc::EpochSec departure) {
  alloc::Reservation r;
  r.vehicleId = id;
  r.arrivalTime = arrival;
  r.departureTime = departure;
  return r;
}

int test_occupancy_grid() {
  int failures = 0;

  const alloc::Facility facility{3, 4};

  // ---- occupy / release state machine ----
  {
    alloc::OccupancyGrid g(facility);
    CHECK(g.occupiedCount() == 0);
    CHECK(g.freeCount() == 12);
    CHECK(g.isFree(1, 2));
    CHECK(!g.isFree(3, 0));
    CHECK(!g.isFree(0, -1));

    alloc::AllocError err;
    CHECK(g.occupy(1, 2, res("a", 100, 200), &err));
    CHECK(!g.isFree(1, 2));
    CHECK(g.occupiedCount() == 1);
    CHECK(nearly(g.occupancyRatio(), 1.0 / 12.0));

    const alloc::Reservation* held = g.reservationAt(alloc::Cell{1, 2});
    CHECK(held != nullptr && held->vehicleId == "a");
    CHECK(g.reservationAt(alloc::Cell{0, 0}) == nullptr);
    CHECK(g.reservationAt(alloc::Cell{9, 9}) == nullptr);

    // Second occupy: Conflict, warning logged, state unchanged.
    int warnings = 0;
    const core::LogSink sink{&countWarnings, &warnings};
    core::addLogSink(sink);
    CHECK(!g.occupy(1, 2, res("b", 100, 200), &err));
    core::removeLogSink(sink);
    CHECK(err.code == alloc::ErrorCode::Conflict);
    CHECK(warnings == 1);
    CHECK(g.occupiedCount() == 1);
    CHECK(g.reservationAt(alloc::Cell{1, 2})->vehicleId == "a");

    CHECK(!g.occupy(3, 0, res("c", 100, 200), &err));
    CHECK(err.code == alloc::ErrorCode::OutOfRange);
    CHECK(!g.occupy(0, 0, res("d", 200, 200), &err));
    CHECK(err.code == alloc::ErrorCode::InvalidRequest);
    CHECK(g.isFree(0, 0));
    CHECK(g.occupiedCount() == 1);

    CHECK(g.release(1, 2, &err));
    CHECK(g.isFree(1, 2));
    CHECK(!g.release(1, 2, &err));
    CHECK(err.code == alloc::ErrorCode::NotOccupied);
    CHECK(!g.release(-1, 0, &err));
    CHECK(err.code == alloc::ErrorCode::OutOfRange);
    CHECK(g.occupiedCount() == 0);
  }

  // ---- freeCells order ----
  {
    alloc::OccupancyGrid g(facility);
    CHECK(g.occupy(alloc::Cell{0, 0}, res("a", 0, 10)));
    CHECK(g.occupy(alloc::Cell{0, 2}, res("b", 0, 10)));
    CHECK(g.occupy(alloc::Cell{2, 3}, res("c", 0, 10)));

    const std::vector<alloc::Cell> free = g.freeCells().collect();
    CHECK(free.size() == 9);
    if (free.size() == 9) {
      CHECK(free[0] == (alloc::Cell{0, 1}));
      CHECK(free[1] == (alloc::Cell{0, 3}));
      CHECK(free[2] == (alloc::Cell{1, 0}));
      CHECK(free[8] == (alloc::Cell{2, 2}));
    }
    for (std::size_t i = 1; i < free.size(); ++i) {
      CHECK(facility.actionId(free[i - 1]) < facility.actionId(free[i]));
    }

    for (int a = 0; a < facility.capacity(); ++a) {
      const alloc::Cell c = facility.cellFromAction(a);
      if (g.isFree(c)) continue;
      CHECK(g.occupy(c, res("fill", 0, 10)));
    }
    CHECK(g.freeCells().empty());
    CHECK(g.freeCount() == 0);
  }

  // ---- snapshot is a copy ----
  {
    alloc::OccupancyGrid g(facility);
    CHECK(g.occupy(2, 1, res("snap", 5, 50)));
    const alloc::GridSnapshot s = g.snapshot();
    CHECK(s.facility == facility);
    CHECK(s.cells.size() == 12);
    CHECK(s.at(alloc::Cell{2, 1}).has_value());
    CHECK(g.release(2, 1));
    CHECK(s.at(alloc::Cell{2, 1}).has_value());
    CHECK(!g.snapshot().at(alloc::Cell{2, 1}).has_value());
  }

  // ---- reset() pre-fill ----
  {
    alloc::OccupancyGrid a(facility);
    alloc::OccupancyGrid b(facility);
    a.reset(0.5, 1234);
    b.reset(0.5, 1234);
    CHECK(a.occupiedCount() == 6);

    std::set<int> cellsA, cellsB;
    for (int i = 0; i < facility.capacity(); ++i) {
      if (!a.isFree(facility.cellFromAction(i))) cellsA.insert(i);
      if (!b.isFree(facility.cellFromAction(i))) cellsB.insert(i);
    }
    CHECK(cellsA == cellsB);

    const alloc::Reservation* r = a.reservationAt(facility.cellFromAction(*cellsA.begin()));
    CHECK(r != nullptr && r->vehicleId.rfind("prefill-", 0) == 0);
    CHECK(r != nullptr && r->departureTime == alloc::kPrefillDeparture);

    // A different seed picks a different subset (for this shape and seed pair).
    alloc::OccupancyGrid c(facility);
    c.reset(0.5, 99);
    std::set<int> cellsC;
    for (int i = 0; i < facility.capacity(); ++i) {
      if (!c.isFree(facility.cellFromAction(i))) cellsC.insert(i);
    }
    CHECK(cellsC.size() == 6);

    // reset() clears earlier reservations.
    a.reset(0.0, 1234);
    CHECK(a.occupiedCount() == 0);

    // Out-of-range ratios are clamped.
    a.reset(2.0, 1);
    CHECK(a.occupiedCount() == 12);
    a.reset(-0.5, 1);
    CHECK(a.occupiedCount() == 0);
  }

  // ---- releaseExpired ----
  {
    alloc::OccupancyGrid g(facility);
    CHECK(g.occupy(0, 0, res("early", 0, 100)));
    CHECK(g.occupy(0, 1, res("late", 0, 300)));
    CHECK(g.releaseExpired(99) == 0);
    CHECK(g.releaseExpired(100) == 1);
    CHECK(g.isFree(0, 0));
    CHECK(!g.isFree(0, 1));
    CHECK(g.occupiedCount() == 1);
  }

  return failures;
}
