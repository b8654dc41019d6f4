#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/VehicleRequest.h"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace parkwise::alloc {

// Request batches as CSV:
//
//   vehicle_id,plate_type,vehicle_class,arrival_time,departure_time[,priority]
//
// The header line is optional. Blank lines and lines starting with '#' are
// skipped. Plate/class accept names or numeric codes; an empty or missing
// priority takes defaultPriority(plate). Times go through parseTimestamp().
//
// Rows with departure <= arrival are kept: the engine reports them as invalid
// requests. Anything unparseable fails the whole load with "<source>:<line>:".
bool parseRequestsCsv(std::istream& in, std::vector<VehicleRequest>& out, AllocError* outError = nullptr,
                      std::string_view sourceName = "<input>");

bool loadRequestsCsv(const std::string& path, std::vector<VehicleRequest>& out, AllocError* outError = nullptr);

} // namespace parkwise::alloc
