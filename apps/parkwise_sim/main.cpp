#include "parkwise/alloc/AllocationService.h"
#include "parkwise/alloc/EngineConfig.h"
#include "parkwise/alloc/FacilityStatus.h"
#include "parkwise/alloc/PolicyComparison.h"
#include "parkwise/alloc/RecordStore.h"
#include "parkwise/alloc/ReportIo.h"
#include "parkwise/alloc/RequestIo.h"
#include "parkwise/alloc/ScoringAdapter.h"
#include "parkwise/alloc/ScoringModel.h"
#include "parkwise/alloc/SimulationRunner.h"
#include "parkwise/alloc/ValueTable.h"
#include "parkwise/core/Args.h"
#include "parkwise/core/CVar.h"
#include "parkwise/core/JobSystem.h"
#include "parkwise/core/JsonWriter.h"
#include "parkwise/core/Log.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace parkwise;

static void printHelp() {
  std::cout << "parkwise_sim\n"
            << "  --config <file>        Load cvars from a 'name = value' file\n"
            << "  --set <name=value>     Override one cvar (repeatable)\n"
            << "  --policy <kind>        learned|sequential|random (sets policy.kind)\n"
            << "  --model <file>         Linear scoring model (default: constant suitability 1.0)\n"
            << "  --qtable <file>        Value table for the learned policy (default: none)\n"
            << "  --json                 Emit machine-readable JSON (also works with --out)\n"
            << "  --out <path>           Write output to a file instead of stdout ('-' means stdout)\n"
            << "\n"
            << "Batch simulation:\n"
            << "  --requests <csv>       vehicle_id,plate_type,vehicle_class,arrival_time,departure_time[,priority]\n"
            << "  --compare              Run learned, sequential and random side by side\n"
            << "  --records <file>       Save the allocated outcomes as allocation records\n"
            << "\n"
            << "Facility status:\n"
            << "  --status               Print per-bay occupancy (from --records if given, else the batch result)\n"
            << "  --now <time>           Reference time for --status (default: current time)\n"
            << "\n"
            << "  --list-cvars           Print every cvar with its current value\n"
            << "  --save-config <file>   Write the effective cvars to a config file\n"
            << "  --help, -h             Show this help\n";
}

static void listCVars(std::ostream& out) {
  for (const core::CVar* cv : core::cvars().list()) {
    out << cv->name << " = " << core::CVarRegistry::valueToString(*cv) << "   # " << cv->help << "\n";
  }
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args;
  for (const char* s : {"compare", "status", "json", "help", "list-cvars"}) args.addSwitch(s);
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  core::CVarRegistry& reg = core::cvars();
  alloc::installEngineCVars(reg);

  std::string err;
  std::string configPath;
  if (args.getString("config", configPath) && !reg.loadFile(configPath, &err)) {
    std::cerr << "Failed to load --config: " << err << "\n";
    return 2;
  }
  for (const auto& assignment : args.values("set")) {
    if (!reg.assign(assignment, &err)) {
      std::cerr << "Bad --set '" << assignment << "': " << err << "\n";
      return 2;
    }
  }
  std::string policyName;
  if (args.getString("policy", policyName) && !reg.setString("policy.kind", policyName, &err)) {
    std::cerr << "Bad --policy: " << err << "\n";
    return 2;
  }

  if (args.hasFlag("list-cvars")) {
    listCVars(std::cout);
    return 0;
  }

  std::string saveConfigPath;
  if (args.getString("save-config", saveConfigPath)) {
    if (!reg.saveFile(saveConfigPath, &err)) {
      std::cerr << "Failed to write --save-config: " << err << "\n";
      return 1;
    }
    PARKWISE_LOG_INFO("wrote config to " + saveConfigPath);
  }

  alloc::AllocError aerr;
  alloc::EngineConfig config;
  if (!alloc::engineConfigFromCVars(reg, config, &aerr)) {
    std::cerr << "Invalid configuration: " << aerr.message << "\n";
    return 2;
  }

  // Scoring inputs.
  alloc::ScoringFunctions functions = alloc::constantScoring(1.0);
  std::string modelPath;
  if (args.getString("model", modelPath)) {
    alloc::LinearScoringModel model;
    if (!alloc::loadLinearScoringModel(modelPath, model, &aerr)) {
      std::cerr << "Failed to load --model: " << aerr.message << "\n";
      return 1;
    }
    functions = model.toFunctions();
  }

  alloc::ValueTable values;
  std::string qtablePath;
  if (args.getString("qtable", qtablePath) && !alloc::loadValueTable(qtablePath, values, &aerr)) {
    std::cerr << "Failed to load --qtable: " << aerr.message << "\n";
    return 1;
  }

  const alloc::ScoringAdapter scoring(std::move(functions), std::move(values), config.scoring);

  // Time reference for --status.
  alloc::EpochSec now = alloc::nowEpoch();
  std::string nowText;
  if (args.getString("now", nowText)) {
    alloc::ParsedTime t;
    if (!alloc::parseTimestamp(nowText, t)) {
      std::cerr << "Bad --now '" << nowText << "'\n";
      return 2;
    }
    now = t.utc;
  }

  const bool json = args.hasFlag("json");
  const bool wantStatus = args.hasFlag("status");
  std::string outPath;
  (void)args.getString("out", outPath);

  std::unique_ptr<std::ofstream> outFile;
  std::ostream* out = &std::cout;
  if (!outPath.empty() && outPath != "-") {
    outFile = std::make_unique<std::ofstream>(outPath, std::ios::out | std::ios::trunc);
    if (!*outFile) {
      std::cerr << "Failed to open --out file: " << outPath << "\n";
      return 1;
    }
    out = outFile.get();
  }

  core::JsonWriter j(*out, /*pretty=*/true);

  std::string recordsPath;
  (void)args.getString("records", recordsPath);

  std::string requestsPath;
  if (!args.getString("requests", requestsPath)) {
    if (!wantStatus) {
      if (!saveConfigPath.empty()) return 0;
      printHelp();
      return 2;
    }

    // Status of a persisted record set, as the live service would see it.
    alloc::InMemoryRecordStore store;
    if (!recordsPath.empty()) {
      std::vector<alloc::AllocationRecord> records;
      if (!alloc::loadRecords(recordsPath, records, &aerr) || !store.restore(records, &aerr)) {
        std::cerr << "Failed to load --records: " << aerr.message << "\n";
        return 1;
      }
    }

    alloc::Policy policy;
    if (!alloc::makePolicy(config.policy, config, &scoring, policy, &aerr)) {
      std::cerr << "Invalid policy: " << aerr.message << "\n";
      return 2;
    }
    alloc::AllocationService service(config, std::move(policy), store);
    if (!recordsPath.empty()) service.rebuildFromStore(now);

    const alloc::FacilityStatus status = service.status(now);
    if (json) {
      alloc::writeStatusJson(j, status);
    } else {
      alloc::printStatus(*out, status);
    }
    return 0;
  }

  std::vector<alloc::VehicleRequest> requests;
  if (!alloc::loadRequestsCsv(requestsPath, requests, &aerr)) {
    std::cerr << "Failed to load --requests: " << aerr.message << "\n";
    return 1;
  }

  if (args.hasFlag("compare")) {
    core::JobSystem jobs(3);
    std::vector<alloc::SimulationReport> reports;
    if (!alloc::comparePolicies(requests, config, &scoring, reports, &aerr, &jobs)) {
      std::cerr << "Comparison failed: " << aerr.message << "\n";
      return 1;
    }
    if (json) {
      alloc::writeComparisonJson(j, reports);
    } else {
      alloc::printComparison(*out, reports);
    }
    return 0;
  }

  alloc::Policy policy;
  if (!alloc::makePolicy(config.policy, config, &scoring, policy, &aerr)) {
    std::cerr << "Invalid policy: " << aerr.message << "\n";
    return 2;
  }

  const alloc::SimulationReport report = alloc::runSimulation(requests, policy, config.simulationParams());

  std::vector<alloc::AllocationRecord> committed;
  if (!recordsPath.empty()) {
    alloc::InMemoryRecordStore store;
    if (!alloc::commitSimulation(report, requests, store, &aerr)) {
      std::cerr << "Failed to commit results: " << aerr.message << "\n";
      return 1;
    }
    committed = store.list();
    if (!alloc::saveRecords(committed, recordsPath, &aerr)) {
      std::cerr << "Failed to save --records: " << aerr.message << "\n";
      return 1;
    }
  }

  if (json) {
    j.beginObject();
    j.key("report");
    alloc::writeReportJson(j, report);
    if (wantStatus) {
      j.key("status");
      alloc::writeStatusJson(j, alloc::buildFacilityStatus(report.finalGrid, now, alloc::ExpiredReservationMode::TrustGrid));
    }
    if (!recordsPath.empty()) {
      j.key("records");
      j.beginArray();
      for (const auto& r : committed) alloc::writeRecordJson(j, r);
      j.endArray();
    }
    j.endObject();
  } else {
    alloc::printReport(*out, report);
    if (wantStatus) {
      *out << "\n";
      alloc::printStatus(*out, alloc::buildFacilityStatus(report.finalGrid, now, alloc::ExpiredReservationMode::TrustGrid));
    }
    if (!recordsPath.empty()) *out << "\nwrote " << committed.size() << " records to " << recordsPath << "\n";
  }

  return 0;
}
