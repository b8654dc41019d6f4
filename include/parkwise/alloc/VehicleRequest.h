#pragma once

#include "parkwise/alloc/Time.h"
#include "parkwise/core/Types.h"

#include <string>
#include <string_view>

namespace parkwise::alloc {

enum class PlateType : core::u8 {
  Private    = 0,
  Public     = 1,
  Government = 2,
};

enum class VehicleClass : core::u8 {
  Car        = 0,
  Truck      = 1,
  Motorcycle = 2,
};

const char* toString(PlateType t);
const char* toString(VehicleClass c);

// Accept names ("government", case-insensitive) or numeric codes ("2").
bool parsePlateType(std::string_view text, PlateType& out);
bool parseVehicleClass(std::string_view text, VehicleClass& out);

// Government plates default to priority 2, everything else to 1.
int defaultPriority(PlateType t);

// One arriving vehicle. Built once by makeVehicleRequest() and passed by
// const reference afterwards; the derived fields are never recomputed.
struct VehicleRequest {
  std::string vehicleId;
  PlateType plateType{PlateType::Private};
  VehicleClass vehicleClass{VehicleClass::Car};
  EpochSec arrivalTime{0};
  EpochSec departureTime{0};
  int priorityLevel{1};
  int utcOffsetMinutes{0};

  // Derived model features (wall clock of the arrival).
  double durationHours{0.0};
  int dayOfWeek{0};
  int hourOfDay{0};

  bool validWindow() const { return arrivalTime < departureTime; }
};

VehicleRequest makeVehicleRequest(std::string vehicleId,
                                  PlateType plateType,
                                  VehicleClass vehicleClass,
                                  EpochSec arrivalTime,
                                  EpochSec departureTime,
                                  int priorityLevel,
                                  int utcOffsetMinutes = 0);

} // namespace parkwise::alloc
