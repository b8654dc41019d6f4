#include "parkwise/alloc/VehicleRequest.h"

#include <cctype>
#include <string>

namespace parkwise::alloc {

const char* toString(PlateType t) {
  switch (t) {
    case PlateType::Private:    return "private";
    case PlateType::Public:     return "public";
    case PlateType::Government: return "government";
  }
  return "?";
}

const char* toString(VehicleClass c) {
  switch (c) {
    case VehicleClass::Car:        return "car";
    case VehicleClass::Truck:      return "truck";
    case VehicleClass::Motorcycle: return "motorcycle";
  }
  return "?";
}

static std::string normalizeToken(std::string_view s) {
  std::string out;
  for (char c : s) {
    if (std::isspace((unsigned char)c)) continue;
    out.push_back((char)std::tolower((unsigned char)c));
  }
  return out;
}

bool parsePlateType(std::string_view text, PlateType& out) {
  const std::string k = normalizeToken(text);
  if (k == "0" || k == "private")                     { out = PlateType::Private;    return true; }
  if (k == "1" || k == "public")                      { out = PlateType::Public;     return true; }
  if (k == "2" || k == "government" || k == "govt")   { out = PlateType::Government; return true; }
  return false;
}

bool parseVehicleClass(std::string_view text, VehicleClass& out) {
  const std::string k = normalizeToken(text);
  if (k == "0" || k == "car")                         { out = VehicleClass::Car;        return true; }
  if (k == "1" || k == "truck")                       { out = VehicleClass::Truck;      return true; }
  if (k == "2" || k == "motorcycle" || k == "bike")   { out = VehicleClass::Motorcycle; return true; }
  return false;
}

int defaultPriority(PlateType t) {
  return t == PlateType::Government ? 2 : 1;
}

VehicleRequest makeVehicleRequest(std::string vehicleId,
                                  PlateType plateType,
                                  VehicleClass vehicleClass,
                                  EpochSec arrivalTime,
                                  EpochSec departureTime,
                                  int priorityLevel,
                                  int utcOffsetMinutes) {
  VehicleRequest r;
  r.vehicleId = std::move(vehicleId);
  r.plateType = plateType;
  r.vehicleClass = vehicleClass;
  r.arrivalTime = arrivalTime;
  r.departureTime = departureTime;
  r.priorityLevel = priorityLevel;
  r.utcOffsetMinutes = utcOffsetMinutes;

  r.durationHours = static_cast<double>(departureTime - arrivalTime) / static_cast<double>(kSecondsPerHour);
  r.dayOfWeek = dayOfWeek(arrivalTime, utcOffsetMinutes);
  r.hourOfDay = hourOfDay(arrivalTime, utcOffsetMinutes);
  return r;
}

} // namespace parkwise::alloc
