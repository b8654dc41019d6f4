#pragma once

#include "parkwise/alloc/FacilityStatus.h"
#include "parkwise/alloc/RecordStore.h"
#include "parkwise/alloc/SimulationRunner.h"
#include "parkwise/core/JsonWriter.h"

#include <ostream>
#include <vector>

namespace parkwise::alloc {

// Human-readable and JSON renderings used by parkwise_sim.

void printReport(std::ostream& out, const SimulationReport& report, bool withOutcomes = true);
void printComparison(std::ostream& out, const std::vector<SimulationReport>& reports);
void printStatus(std::ostream& out, const FacilityStatus& status);

void writeReportJson(core::JsonWriter& j, const SimulationReport& report, bool withOutcomes = true);
void writeComparisonJson(core::JsonWriter& j, const std::vector<SimulationReport>& reports);
void writeStatusJson(core::JsonWriter& j, const FacilityStatus& status);
void writeRecordJson(core::JsonWriter& j, const AllocationRecord& record);

} // namespace parkwise::alloc
