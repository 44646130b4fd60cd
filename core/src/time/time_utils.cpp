#include "sigcore/time/time_utils.hpp"

#include <cstdio>

namespace sigcore {

namespace {

// Civil date <-> days since 1970-01-01 in the proleptic Gregorian calendar.
// Valid for the full int64 range we care about, including pre-epoch dates.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

CivilDate civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
  return {y, m, d};
}

bool isLeapYear(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(std::int64_t y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeapYear(y)) ? 29 : kDays[m - 1];
}

// Floor division; C++ '/' truncates toward zero.
std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// Reads exactly `width` digits starting at `pos`. Advances pos on success.
bool readDigits(std::string_view text, std::size_t& pos, std::size_t width,
                int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  pos += width;
  return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
  if (pos < text.size() && text[pos] == c) {
    ++pos;
    return true;
  }
  return false;
}

}  // namespace

// -----------------------------------------------------------------------------
// formatIso8601(): split into days + time-of-day, then render
// -----------------------------------------------------------------------------
std::string formatIso8601(Timestamp tp) {
  constexpr std::int64_t kMicrosPerDay = 86400LL * 1000000LL;

  const std::int64_t micros =
      std::chrono::floor<std::chrono::microseconds>(tp.time_since_epoch())
          .count();
  const std::int64_t days = floorDiv(micros, kMicrosPerDay);
  std::int64_t rem = micros - days * kMicrosPerDay;

  const CivilDate date = civilFromDays(days);
  const int hour = static_cast<int>(rem / 3600000000LL);
  rem %= 3600000000LL;
  const int minute = static_cast<int>(rem / 60000000LL);
  rem %= 60000000LL;
  const int second = static_cast<int>(rem / 1000000LL);
  const int micro = static_cast<int>(rem % 1000000LL);

  char buf[48];
  int n = std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d",
                        static_cast<long long>(date.year), date.month,
                        date.day, hour, minute, second);
  if (micro != 0) {
    n += std::snprintf(buf + n, sizeof(buf) - static_cast<std::size_t>(n),
                       ".%06d", micro);
  }
  std::string out(buf, static_cast<std::size_t>(n));
  out.push_back('Z');
  return out;
}

// -----------------------------------------------------------------------------
// parseIso8601(): fixed-layout scan, range checks, offset normalization
// -----------------------------------------------------------------------------
std::optional<Timestamp> parseIso8601(std::string_view text) {
  std::size_t pos = 0;
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (!expect(text, pos, 'T') && !expect(text, pos, ' ')) {
    return std::nullopt;
  }
  if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, second)) {
    return std::nullopt;
  }

  if (month < 1 || month > 12 || day < 1 ||
      static_cast<unsigned>(day) >
          daysInMonth(year, static_cast<unsigned>(month)) ||
      hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  std::int64_t nanos = 0;
  if (expect(text, pos, '.')) {
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits == 9) {
        return std::nullopt;
      }
      nanos = nanos * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 9; ++i) {
      nanos *= 10;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < text.size()) {
    const char zone = text[pos++];
    if (zone == 'Z' || zone == 'z') {
      // UTC
    } else if (zone == '+' || zone == '-') {
      int off_h = 0, off_m = 0;
      if (!readDigits(text, pos, 2, off_h)) {
        return std::nullopt;
      }
      expect(text, pos, ':');
      if (!readDigits(text, pos, 2, off_m) || off_h > 23 || off_m > 59) {
        return std::nullopt;
      }
      offset_seconds = (off_h * 3600 + off_m * 60) * (zone == '-' ? -1 : 1);
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month),
                                          static_cast<unsigned>(day));
  const std::int64_t seconds =
      days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

  // Timestamp::duration is nanoseconds on some platforms; reject instants
  // it cannot hold instead of letting the conversion overflow.
  constexpr std::int64_t kMaxSeconds =
      std::chrono::duration_cast<std::chrono::seconds>(
          Timestamp::duration::max())
          .count();
  constexpr std::int64_t kMinSeconds =
      std::chrono::duration_cast<std::chrono::seconds>(
          Timestamp::duration::min())
          .count();
  if (seconds >= kMaxSeconds || seconds < kMinSeconds) {
    return std::nullopt;
  }

  return Timestamp{
      std::chrono::duration_cast<Timestamp::duration>(
          std::chrono::seconds{seconds}) +
      std::chrono::duration_cast<Timestamp::duration>(
          std::chrono::nanoseconds{nanos})};
}

}  // namespace sigcore
