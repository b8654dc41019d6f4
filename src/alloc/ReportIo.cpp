#include "parkwise/alloc/ReportIo.h"

#include <iomanip>

namespace parkwise::alloc {

void printReport(std::ostream& out, const SimulationReport& r, bool withOutcomes) {
  out << "policy:        " << toString(r.policy) << "\n"
      << "facility:      " << r.facility.numBays << " bays x " << r.facility.slotsPerBay << " slots\n"
      << "vehicles:      " << r.totalVehicles << "\n"
      << "allocated:     " << r.successful << "\n"
      << "failed:        " << r.failed << "\n"
      << "success rate:  " << std::fixed << std::setprecision(3) << r.successRate << "\n"
      << "average score: " << std::fixed << std::setprecision(4) << r.averageScore << "\n"
      << "elapsed:       " << std::fixed << std::setprecision(6) << r.totalProcessingSeconds << "s\n";

  if (!withOutcomes) return;

  for (const auto& o : r.outcomes) {
    out << "  " << std::left << std::setw(16) << o.vehicleId << std::right;
    if (o.success) {
      out << " bay " << o.decision.bayAssigned << " slot " << o.decision.slotAssigned << " score " << std::fixed
          << std::setprecision(4) << o.decision.score;
    } else {
      out << " FAILED (" << toString(o.error) << "): " << o.message;
    }
    out << "\n";
  }
}

void printComparison(std::ostream& out, const std::vector<SimulationReport>& reports) {
  out << std::left << std::setw(12) << "policy" << std::right << std::setw(10) << "allocated" << std::setw(8)
      << "failed" << std::setw(10) << "rate" << std::setw(12) << "avg score" << "\n";
  for (const auto& r : reports) {
    out << std::left << std::setw(12) << toString(r.policy) << std::right << std::setw(10) << r.successful
        << std::setw(8) << r.failed << std::setw(10) << std::fixed << std::setprecision(3) << r.successRate
        << std::setw(12) << std::setprecision(4) << r.averageScore << "\n";
  }
}

void printStatus(std::ostream& out, const FacilityStatus& s) {
  out << "updated:   " << formatTimestamp(s.updatedAt) << "\n"
      << "occupied:  " << s.occupiedSlots << "/" << s.totalSlots << " (" << std::fixed << std::setprecision(1)
      << s.occupancyPercentage << "%)\n";

  for (const auto& bay : s.bays) {
    out << "bay " << std::setw(3) << bay.bayNumber << " ";
    for (const auto& slot : bay.slots) out << (slot.occupied ? '#' : '.');
    out << "\n";
  }
}

static void writeOutcomeJson(core::JsonWriter& j, const SimulationOutcome& o) {
  j.beginObject();
  j.key("vehicleId"); j.value(o.vehicleId);
  j.key("success"); j.value(o.success);
  if (o.success) {
    j.key("bay"); j.value(o.decision.bayAssigned);
    j.key("slot"); j.value(o.decision.slotAssigned);
    j.key("score"); j.value(o.decision.score);
    j.key("decisionTime"); j.value(formatTimestamp(o.decision.decisionTime));
  } else {
    j.key("error"); j.value(toString(o.error));
    j.key("message"); j.value(o.message);
  }
  j.endObject();
}

void writeReportJson(core::JsonWriter& j, const SimulationReport& r, bool withOutcomes) {
  j.beginObject();
  j.key("policy"); j.value(toString(r.policy));
  j.key("bays"); j.value(r.facility.numBays);
  j.key("slotsPerBay"); j.value(r.facility.slotsPerBay);
  j.key("totalVehicles"); j.value(r.totalVehicles);
  j.key("successful"); j.value(r.successful);
  j.key("failed"); j.value(r.failed);
  j.key("successRate"); j.value(r.successRate);
  j.key("averageScore"); j.value(r.averageScore);
  j.key("totalProcessingSeconds"); j.value(r.totalProcessingSeconds);
  if (withOutcomes) {
    j.key("outcomes");
    j.beginArray();
    for (const auto& o : r.outcomes) writeOutcomeJson(j, o);
    j.endArray();
  }
  j.endObject();
}

void writeComparisonJson(core::JsonWriter& j, const std::vector<SimulationReport>& reports) {
  j.beginObject();
  j.key("comparison");
  j.beginArray();
  for (const auto& r : reports) writeReportJson(j, r, false);
  j.endArray();
  j.endObject();
}

void writeStatusJson(core::JsonWriter& j, const FacilityStatus& s) {
  j.beginObject();
  j.key("totalSlots"); j.value(s.totalSlots);
  j.key("occupiedSlots"); j.value(s.occupiedSlots);
  j.key("availableSlots"); j.value(s.availableSlots);
  j.key("occupancyPercentage"); j.value(s.occupancyPercentage);
  j.key("updatedAt"); j.value(formatTimestamp(s.updatedAt));
  j.key("bays");
  j.beginArray();
  for (const auto& bay : s.bays) {
    j.beginObject();
    j.key("bayNumber"); j.value(bay.bayNumber);
    j.key("slots");
    j.beginArray();
    for (const auto& slot : bay.slots) {
      j.beginObject();
      j.key("slotNumber"); j.value(slot.slotNumber);
      j.key("occupied"); j.value(slot.occupied);
      j.key("reservation");
      if (slot.reservation) {
        j.beginObject();
        j.key("vehicleId"); j.value(slot.reservation->vehicleId);
        j.key("arrivalTime"); j.value(formatTimestamp(slot.reservation->arrivalTime));
        j.key("departureTime"); j.value(formatTimestamp(slot.reservation->departureTime));
        j.key("priority"); j.value(slot.reservation->priorityLevel);
        j.endObject();
      } else {
        j.nullValue();
      }
      j.endObject();
    }
    j.endArray();
    j.endObject();
  }
  j.endArray();
  j.endObject();
}

void writeRecordJson(core::JsonWriter& j, const AllocationRecord& r) {
  j.beginObject();
  j.key("id"); j.value((long long)r.id);
  j.key("vehicleId"); j.value(r.vehicleId);
  j.key("plateType"); j.value(toString(r.plateType));
  j.key("vehicleClass"); j.value(toString(r.vehicleClass));
  j.key("bay"); j.value(r.bayAssigned);
  j.key("slot"); j.value(r.slotAssigned);
  j.key("score"); j.value(r.score);
  j.key("allocationTime"); j.value(formatTimestamp(r.allocationTime));
  j.key("departureTime"); j.value(formatTimestamp(r.departureTime));
  j.key("priority"); j.value(r.priorityLevel);
  j.key("active"); j.value(r.active);
  j.endObject();
}

} // namespace parkwise::alloc
