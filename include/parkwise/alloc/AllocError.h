#pragma once

#include "parkwise/core/Types.h"

#include <string>
#include <utility>

namespace parkwise::alloc {

// Failure categories reported by the engine. Exhausted capacity is not an
// error for decide(); it only appears here for callers that need a record
// (AllocationService::allocate).
enum class ErrorCode : core::u8 {
  None              = 0,
  InvalidRequest    = 1, // arrival >= departure, malformed input
  Conflict          = 2, // occupy() on an occupied cell
  NotOccupied       = 3, // release() on a free cell
  OutOfRange        = 4, // bay/slot outside the facility
  ScoringFailed     = 5, // external scoring function misbehaved
  CapacityExhausted = 6,
  NotFound          = 7, // unknown record id
  BadConfig         = 8,
  Io                = 9,
};

const char* toString(ErrorCode code);

struct AllocError {
  ErrorCode code{ErrorCode::None};
  std::string message;
};

// Fills `out` (when non-null) and returns false, so failure paths read
// `return fail(outError, ErrorCode::Conflict, "...");`
inline bool fail(AllocError* out, ErrorCode code, std::string message) {
  if (out) {
    out->code = code;
    out->message = std::move(message);
  }
  return false;
}

} // namespace parkwise::alloc
