#include "parkwise/alloc/AllocError.h"

namespace parkwise::alloc {

const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:              return "none";
    case ErrorCode::InvalidRequest:    return "invalid_request";
    case ErrorCode::Conflict:          return "conflict";
    case ErrorCode::NotOccupied:       return "not_occupied";
    case ErrorCode::OutOfRange:        return "out_of_range";
    case ErrorCode::ScoringFailed:     return "scoring_failed";
    case ErrorCode::CapacityExhausted: return "capacity_exhausted";
    case ErrorCode::NotFound:          return "not_found";
    case ErrorCode::BadConfig:         return "bad_config";
    case ErrorCode::Io:                return "io";
  }
  return "unknown";
}

} // namespace parkwise::alloc
