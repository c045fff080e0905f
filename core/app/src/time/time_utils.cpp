#include "cadence/time/time_utils.hpp"

#include <cstdio>

namespace cadence {

namespace {

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerDay = 86400 * kMsPerSecond;

// Days since 1970-01-01 for a civil date (Howard Hinnant's days_from_civil).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

// Inverse of days_from_civil.
void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m,
                     unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

// Floor division for negative epoch offsets.
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

}  // namespace

std::int64_t utc_ms(int year, unsigned month, unsigned day, unsigned hour,
                    unsigned minute, unsigned second) {
  const std::int64_t days = days_from_civil(year, month, day);
  return days * kMsPerDay +
         (static_cast<std::int64_t>(hour) * 3600 + minute * 60 + second) *
             kMsPerSecond;
}

std::string format_timestamp(Timestamp tp) {
  if (tp == kNegativeInfinity) {
    return "-inf";
  }
  if (tp == kPositiveInfinity) {
    return "+inf";
  }

  const std::int64_t ms = timestamp_to_ms(tp);
  const std::int64_t days = floor_div(ms, kMsPerDay);
  const std::int64_t ms_of_day = ms - days * kMsPerDay;

  std::int64_t year = 0;
  unsigned month = 0;
  unsigned day = 0;
  civil_from_days(days, year, month, day);

  const auto secs = static_cast<int>(ms_of_day / kMsPerSecond);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02d:%02d:%02d",
                static_cast<long long>(year), month, day, secs / 3600,
                (secs / 60) % 60, secs % 60);
  return buf;
}

std::string format_duration(Duration d) {
  const bool negative = d.count() < 0;
  std::int64_t ms = negative ? -d.count() : d.count();

  const std::int64_t days = ms / kMsPerDay;
  ms %= kMsPerDay;
  const std::int64_t secs = ms / kMsPerSecond;
  const std::int64_t millis = ms % kMsPerSecond;

  char buf[64];
  int n = 0;
  if (days > 0) {
    n = std::snprintf(buf, sizeof(buf), "%s%lldd %02lld:%02lld:%02lld",
                      negative ? "-" : "", static_cast<long long>(days),
                      static_cast<long long>(secs / 3600),
                      static_cast<long long>((secs / 60) % 60),
                      static_cast<long long>(secs % 60));
  } else {
    n = std::snprintf(buf, sizeof(buf), "%s%02lld:%02lld:%02lld",
                      negative ? "-" : "",
                      static_cast<long long>(secs / 3600),
                      static_cast<long long>((secs / 60) % 60),
                      static_cast<long long>(secs % 60));
  }
  if (millis != 0 && n > 0 && static_cast<std::size_t>(n) < sizeof(buf)) {
    std::snprintf(buf + n, sizeof(buf) - static_cast<std::size_t>(n), ".%03lld",
                  static_cast<long long>(millis));
  }
  return buf;
}

}  // namespace cadence
