#include "parkwise/alloc/RequestIo.h"

#include "parkwise/core/Log.h"

#include <cctype>
#include <charconv>
#include <system_error>
#include <fstream>
#include <sstream>

namespace parkwise::alloc {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

static std::vector<std::string_view> splitFields(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  for (;;) {
    const std::size_t comma = line.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(trim(line.substr(start)));
      break;
    }
    fields.push_back(trim(line.substr(start, comma - start)));
    start = comma + 1;
  }
  return fields;
}

static bool isHeader(const std::vector<std::string_view>& fields) {
  if (fields.empty()) return false;
  std::string k;
  for (char c : fields[0]) k.push_back((char)std::tolower((unsigned char)c));
  return k == "vehicle_id" || k == "vehicleid" || k == "id";
}

bool parseRequestsCsv(std::istream& in, std::vector<VehicleRequest>& out, AllocError* outError,
                      std::string_view sourceName) {
  std::vector<VehicleRequest> requests;

  std::string line;
  int lineNo = 0;
  bool sawData = false;

  auto lineError = [&](const std::string& what) {
    std::ostringstream oss;
    oss << sourceName << ":" << lineNo << ": " << what;
    PARKWISE_LOG_ERROR("RequestIo: " + oss.str());
    return fail(outError, ErrorCode::InvalidRequest, oss.str());
  };

  while (std::getline(in, line)) {
    ++lineNo;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const std::string_view body = trim(line);
    if (body.empty() || body.front() == '#') continue;

    const auto f = splitFields(body);
    if (!sawData && isHeader(f)) {
      sawData = true;
      continue;
    }
    sawData = true;

    if (f.size() < 5 || f.size() > 6) return lineError("expected 5 or 6 fields, got " + std::to_string(f.size()));
    if (f[0].empty()) return lineError("empty vehicle id");

    PlateType plate{};
    if (!parsePlateType(f[1], plate)) return lineError("unknown plate type '" + std::string(f[1]) + "'");
    VehicleClass cls{};
    if (!parseVehicleClass(f[2], cls)) return lineError("unknown vehicle class '" + std::string(f[2]) + "'");

    ParsedTime arrival, departure;
    if (!parseTimestamp(f[3], arrival)) return lineError("bad arrival time '" + std::string(f[3]) + "'");
    if (!parseTimestamp(f[4], departure)) return lineError("bad departure time '" + std::string(f[4]) + "'");

    int priority = defaultPriority(plate);
    if (f.size() == 6 && !f[5].empty()) {
      const std::string_view p = f[5];
      int v = 0;
      const auto res = std::from_chars(p.data(), p.data() + p.size(), v, 10);
      if (res.ec == std::errc::result_out_of_range) return lineError("priority '" + std::string(p) + "' is out of range");
      if (res.ec != std::errc{} || res.ptr != p.data() + p.size()) return lineError("bad priority '" + std::string(p) + "'");
      priority = v;
    }

    requests.push_back(makeVehicleRequest(std::string(f[0]), plate, cls, arrival.utc, departure.utc, priority,
                                          arrival.utcOffsetMinutes));
  }

  out = std::move(requests);
  return true;
}

bool loadRequestsCsv(const std::string& path, std::vector<VehicleRequest>& out, AllocError* outError) {
  std::ifstream f(path);
  if (!f) {
    PARKWISE_LOG_ERROR("RequestIo: failed to open " + path);
    return fail(outError, ErrorCode::Io, "cannot open requests: " + path);
  }
  return parseRequestsCsv(f, out, outError, path);
}

} // namespace parkwise::alloc
