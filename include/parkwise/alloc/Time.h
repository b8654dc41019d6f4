#pragma once

#include "parkwise/core/Types.h"

#include <string>
#include <string_view>

namespace parkwise::alloc {

// Seconds since 1970-01-01T00:00:00Z.
using EpochSec = core::i64;

inline constexpr EpochSec kSecondsPerHour = 3600;
inline constexpr EpochSec kSecondsPerDay  = 86400;

// Time-only inputs ("HH:MM") are anchored on this calendar date.
inline constexpr int kTimeOnlyYear  = 2025;
inline constexpr int kTimeOnlyMonth = 6;
inline constexpr int kTimeOnlyDay   = 30;

struct ParsedTime {
  EpochSec utc{0};
  // Offset of the written wall clock from UTC, in minutes (+05:30 => 330).
  int utcOffsetMinutes{0};
};

// Days since the epoch for a proleptic Gregorian date.
core::i64 daysFromCivil(int year, unsigned month, unsigned day);

EpochSec makeEpoch(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

// Accepts:
//   YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]   ('T' or ' ' separator)
//   YYYY-MM-DD
//   HH:MM                                          (anchored on kTimeOnly*)
// Inputs without an offset are taken as UTC.
bool parseTimestamp(std::string_view text, ParsedTime& out);

// 0 = Monday ... 6 = Sunday, in the wall clock shifted by `utcOffsetMinutes`.
int dayOfWeek(EpochSec t, int utcOffsetMinutes = 0);
int hourOfDay(EpochSec t, int utcOffsetMinutes = 0);

// "YYYY-MM-DDTHH:MM:SSZ"
std::string formatTimestamp(EpochSec t);

EpochSec nowEpoch();

} // namespace parkwise::alloc
