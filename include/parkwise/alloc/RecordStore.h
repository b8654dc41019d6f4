#pragma once

#include "parkwise/alloc/AllocError.h"
#include "parkwise/alloc/Time.h"
#include "parkwise/alloc/VehicleRequest.h"
#include "parkwise/core/Types.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace parkwise::alloc {

using RecordId = core::i64;

// Persisted result of one allocation. Bay/slot are 1-based.
struct AllocationRecord {
  RecordId id{0};
  std::string vehicleId;
  PlateType plateType{PlateType::Private};
  VehicleClass vehicleClass{VehicleClass::Car};
  int bayAssigned{0};
  int slotAssigned{0};
  double score{0.0};
  EpochSec allocationTime{0};
  EpochSec departureTime{0};
  int priorityLevel{1};
  bool active{true};

  // Holds its slot at `now`.
  bool occupiesAt(EpochSec now) const { return active && now < departureTime; }
};

// Fields that update() may change; unset fields are left alone.
struct RecordPatch {
  std::optional<EpochSec> departureTime;
  std::optional<bool> active;
  std::optional<int> priorityLevel;
};

struct RecordFilter {
  bool activeOnly{false};
  std::string vehicleId; // empty = any
};

// Storage seam for allocation records. Implementations must be safe to call
// from several threads.
class RecordStore {
public:
  virtual ~RecordStore() = default;

  // Assigns and returns a new id; record.id is ignored.
  virtual RecordId create(const AllocationRecord& record) = 0;
  virtual std::optional<AllocationRecord> get(RecordId id) const = 0;
  // nullopt for unknown ids.
  virtual std::optional<AllocationRecord> update(RecordId id, const RecordPatch& patch) = 0;
  // Ascending id order.
  virtual std::vector<AllocationRecord> list(const RecordFilter& filter = {}) const = 0;
  virtual void clear() = 0;
};

class InMemoryRecordStore final : public RecordStore {
public:
  InMemoryRecordStore() = default;

  RecordId create(const AllocationRecord& record) override;
  std::optional<AllocationRecord> get(RecordId id) const override;
  std::optional<AllocationRecord> update(RecordId id, const RecordPatch& patch) override;
  std::vector<AllocationRecord> list(const RecordFilter& filter = {}) const override;
  void clear() override;

  // Replaces the contents with `records`, keeping their ids. Fails with
  // Conflict on duplicate ids or InvalidRequest on ids < 1.
  bool restore(const std::vector<AllocationRecord>& records, AllocError* outError = nullptr);

  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<AllocationRecord> records_; // ascending id
  RecordId nextId_{1};
};

// Line-based text format:
//   ParkwiseRecords 1
//   count <n>
//   record <id> "<vehicleId>" <plate> <class> <bay> <slot> <score> <allocationTime> <departureTime> <priority> <active>
bool saveRecords(const std::vector<AllocationRecord>& records, const std::string& path,
                 AllocError* outError = nullptr);
bool loadRecords(const std::string& path, std::vector<AllocationRecord>& out, AllocError* outError = nullptr);

} // namespace parkwise::alloc
