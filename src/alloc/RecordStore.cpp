#include "parkwise/alloc/RecordStore.h"

#include "parkwise/core/Log.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace parkwise::alloc {

RecordId InMemoryRecordStore::create(const AllocationRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  AllocationRecord r = record;
  r.id = nextId_++;
  records_.push_back(std::move(r));
  return records_.back().id;
}

std::optional<AllocationRecord> InMemoryRecordStore::get(RecordId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::lower_bound(records_.begin(), records_.end(), id,
                                   [](const AllocationRecord& r, RecordId v) { return r.id < v; });
  if (it == records_.end() || it->id != id) return std::nullopt;
  return *it;
}

std::optional<AllocationRecord> InMemoryRecordStore::update(RecordId id, const RecordPatch& patch) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::lower_bound(records_.begin(), records_.end(), id,
                                   [](const AllocationRecord& r, RecordId v) { return r.id < v; });
  if (it == records_.end() || it->id != id) return std::nullopt;

  if (patch.departureTime) it->departureTime = *patch.departureTime;
  if (patch.active) it->active = *patch.active;
  if (patch.priorityLevel) it->priorityLevel = *patch.priorityLevel;
  return *it;
}

std::vector<AllocationRecord> InMemoryRecordStore::list(const RecordFilter& filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AllocationRecord> out;
  for (const auto& r : records_) {
    if (filter.activeOnly && !r.active) continue;
    if (!filter.vehicleId.empty() && r.vehicleId != filter.vehicleId) continue;
    out.push_back(r);
  }
  return out;
}

void InMemoryRecordStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();
  nextId_ = 1;
}

bool InMemoryRecordStore::restore(const std::vector<AllocationRecord>& records, AllocError* outError) {
  std::vector<AllocationRecord> sorted = records;
  std::sort(sorted.begin(), sorted.end(),
            [](const AllocationRecord& a, const AllocationRecord& b) { return a.id < b.id; });
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (sorted[i].id < 1) {
      return fail(outError, ErrorCode::InvalidRequest, "record id " + std::to_string(sorted[i].id) + " is not positive");
    }
    if (i > 0 && sorted[i].id == sorted[i - 1].id) {
      return fail(outError, ErrorCode::Conflict, "duplicate record id " + std::to_string(sorted[i].id));
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  records_ = std::move(sorted);
  nextId_ = records_.empty() ? 1 : records_.back().id + 1;
  return true;
}

std::size_t InMemoryRecordStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

bool saveRecords(const std::vector<AllocationRecord>& records, const std::string& path, AllocError* outError) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    PARKWISE_LOG_ERROR("RecordStore: failed to open for writing: " + path);
    return fail(outError, ErrorCode::Io, "cannot write records: " + path);
  }

  f.precision(17);
  f << "ParkwiseRecords 1\n";
  f << "count " << records.size() << "\n";
  for (const auto& r : records) {
    f << "record " << r.id << " " << std::quoted(r.vehicleId) << " " << static_cast<int>(r.plateType) << " "
      << static_cast<int>(r.vehicleClass) << " " << r.bayAssigned << " " << r.slotAssigned << " " << r.score << " "
      << r.allocationTime << " " << r.departureTime << " " << r.priorityLevel << " " << (r.active ? 1 : 0) << "\n";
  }
  return static_cast<bool>(f) || fail(outError, ErrorCode::Io, "write failed: " + path);
}

static bool expectToken(std::istream& in, const char* tok) {
  std::string t;
  if (!(in >> t)) return false;
  return t == tok;
}

bool loadRecords(const std::string& path, std::vector<AllocationRecord>& out, AllocError* outError) {
  std::ifstream f(path);
  if (!f) {
    PARKWISE_LOG_WARN("RecordStore: file not found: " + path);
    return fail(outError, ErrorCode::Io, "cannot open records: " + path);
  }

  std::string header;
  int version = 0;
  if (!(f >> header >> version) || header != "ParkwiseRecords" || version != 1) {
    PARKWISE_LOG_ERROR("RecordStore: bad header in " + path);
    return fail(outError, ErrorCode::Io, path + ": expected 'ParkwiseRecords 1' header");
  }

  std::size_t count = 0;
  if (!expectToken(f, "count") || !(f >> count)) {
    return fail(outError, ErrorCode::Io, path + ": missing record count");
  }

  std::vector<AllocationRecord> records;
  records.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    AllocationRecord r;
    int plate = 0, cls = 0, active = 0;
    if (!expectToken(f, "record") ||
        !(f >> r.id >> std::quoted(r.vehicleId) >> plate >> cls >> r.bayAssigned >> r.slotAssigned >> r.score >>
          r.allocationTime >> r.departureTime >> r.priorityLevel >> active)) {
      std::ostringstream oss;
      oss << path << ": malformed record " << i;
      return fail(outError, ErrorCode::Io, oss.str());
    }
    if (plate < 0 || plate > 2 || cls < 0 || cls > 2) {
      std::ostringstream oss;
      oss << path << ": record " << r.id << " has an unknown plate/class code";
      return fail(outError, ErrorCode::Io, oss.str());
    }
    r.plateType = static_cast<PlateType>(plate);
    r.vehicleClass = static_cast<VehicleClass>(cls);
    r.active = active != 0;
    records.push_back(std::move(r));
  }

  out = std::move(records);
  return true;
}

} // namespace parkwise::alloc
