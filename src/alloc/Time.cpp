#include "parkwise/alloc/Time.h"

#include <cctype>
#include <chrono>
#include <cstdio>

namespace parkwise::alloc {

static core::i64 floorDiv(core::i64 a, core::i64 b) {
  core::i64 q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

static core::i64 floorMod(core::i64 a, core::i64 b) {
  return a - floorDiv(a, b) * b;
}

// Howard Hinnant's days_from_civil.
core::i64 daysFromCivil(int year, unsigned month, unsigned day) {
  const core::i64 y = static_cast<core::i64>(year) - (month <= 2 ? 1 : 0);
  const core::i64 era = floorDiv(y, 400);
  const core::i64 yoe = y - era * 400;
  const core::i64 mp = (month + 9) % 12;
  const core::i64 doy = (153 * mp + 2) / 5 + day - 1;
  const core::i64 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

static void civilFromDays(core::i64 z, int& year, unsigned& month, unsigned& day) {
  z += 719468;
  const core::i64 era = floorDiv(z, 146097);
  const core::i64 doe = z - era * 146097;
  const core::i64 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const core::i64 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const core::i64 mp = (5 * doy + 2) / 153;
  day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
  month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
  year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

EpochSec makeEpoch(int year, int month, int day, int hour, int minute, int second) {
  return daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * kSecondsPerDay +
         static_cast<EpochSec>(hour) * kSecondsPerHour + static_cast<EpochSec>(minute) * 60 + second;
}

namespace {

// Cursor over the input; every read* helper leaves `pos` untouched on failure.
struct Cursor {
  std::string_view s;
  std::size_t pos{0};

  bool done() const { return pos >= s.size(); }
  char peek() const { return done() ? '\0' : s[pos]; }

  bool readDigits(std::size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (std::size_t i = 0; i < count; ++i) {
      const char c = s[pos + i];
      if (!std::isdigit((unsigned char)c)) return false;
      v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
  }

  bool expect(char c) {
    if (peek() != c) return false;
    ++pos;
    return true;
  }
};

bool validDate(int y, int m, int d) {
  if (m < 1 || m > 12 || d < 1) return false;
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  const bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
  const int maxDay = (m == 2 && leap) ? 29 : kDays[m - 1];
  return d <= maxDay;
}

bool validClock(int h, int mi, int s) {
  return h >= 0 && h < 24 && mi >= 0 && mi < 60 && s >= 0 && s < 61;
}

} // namespace

bool parseTimestamp(std::string_view text, ParsedTime& out) {
  while (!text.empty() && std::isspace((unsigned char)text.front())) text.remove_prefix(1);
  while (!text.empty() && std::isspace((unsigned char)text.back())) text.remove_suffix(1);
  if (text.empty()) return false;

  Cursor c{text};

  // Time-only "HH:MM".
  if (text.size() == 5 && text[2] == ':') {
    int h = 0, mi = 0;
    if (!c.readDigits(2, h) || !c.expect(':') || !c.readDigits(2, mi)) return false;
    if (!validClock(h, mi, 0)) return false;
    out.utc = makeEpoch(kTimeOnlyYear, kTimeOnlyMonth, kTimeOnlyDay, h, mi, 0);
    out.utcOffsetMinutes = 0;
    return true;
  }

  int y = 0, m = 0, d = 0;
  if (!c.readDigits(4, y) || !c.expect('-') || !c.readDigits(2, m) || !c.expect('-') || !c.readDigits(2, d)) {
    return false;
  }
  if (!validDate(y, m, d)) return false;

  int h = 0, mi = 0, s = 0;
  if (!c.done()) {
    if (!c.expect('T') && !c.expect(' ')) return false;
    if (!c.readDigits(2, h) || !c.expect(':') || !c.readDigits(2, mi)) return false;
    if (c.expect(':')) {
      if (!c.readDigits(2, s)) return false;
      // Fractional seconds are accepted and truncated.
      if (c.expect('.')) {
        std::size_t digits = 0;
        while (std::isdigit((unsigned char)c.peek())) {
          ++c.pos;
          ++digits;
        }
        if (digits == 0) return false;
      }
    }
    if (!validClock(h, mi, s)) return false;
  }

  int offsetMin = 0;
  if (!c.done()) {
    const char sign = c.peek();
    if (sign == 'Z' || sign == 'z') {
      ++c.pos;
    } else if (sign == '+' || sign == '-') {
      ++c.pos;
      int oh = 0, om = 0;
      if (!c.readDigits(2, oh)) return false;
      c.expect(':');
      if (!c.readDigits(2, om)) return false;
      if (oh > 23 || om > 59) return false;
      offsetMin = (oh * 60 + om) * (sign == '-' ? -1 : 1);
    } else {
      return false;
    }
  }
  if (!c.done()) return false;

  out.utc = makeEpoch(y, m, d, h, mi, s) - static_cast<EpochSec>(offsetMin) * 60;
  out.utcOffsetMinutes = offsetMin;
  return true;
}

int dayOfWeek(EpochSec t, int utcOffsetMinutes) {
  const EpochSec local = t + static_cast<EpochSec>(utcOffsetMinutes) * 60;
  const core::i64 days = floorDiv(local, kSecondsPerDay);
  // 1970-01-01 was a Thursday (Monday = 0).
  return static_cast<int>(floorMod(days + 3, 7));
}

int hourOfDay(EpochSec t, int utcOffsetMinutes) {
  const EpochSec local = t + static_cast<EpochSec>(utcOffsetMinutes) * 60;
  return static_cast<int>(floorMod(local, kSecondsPerDay) / kSecondsPerHour);
}

std::string formatTimestamp(EpochSec t) {
  const core::i64 days = floorDiv(t, kSecondsPerDay);
  const core::i64 secs = floorMod(t, kSecondsPerDay);

  int y = 0;
  unsigned m = 0, d = 0;
  civilFromDays(days, y, m, d);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ", y, m, d,
                static_cast<int>(secs / 3600), static_cast<int>((secs % 3600) / 60), static_cast<int>(secs % 60));
  return buf;
}

EpochSec nowEpoch() {
  using clock = std::chrono::system_clock;
  return std::chrono::duration_cast<std::chrono::seconds>(clock::now().time_since_epoch()).count();
}

} // namespace parkwise::alloc
