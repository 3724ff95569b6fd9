// Timestamp.cpp

#include "Timestamp.hpp"
#include "WireFormat.hpp"
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace syslog_fmt {
namespace {
std::time_t toTimeT(TimePoint timePoint) noexcept {
  auto seconds = std::chrono::floor<std::chrono::seconds>(timePoint);
  return std::chrono::system_clock::to_time_t(
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(
          seconds));
}

std::tm utcTime(std::time_t t) noexcept {
  std::tm retval{};
  gmtime_r(&t, &retval);
  return retval;
}
} // namespace

Clock systemClock() {
  return [] {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
  };
}

std::string formatRfc3164Timestamp(TimePoint timePoint, TimeZone zone) {
  std::time_t t = toTimeT(timePoint);

  std::tm brokenDown{};
  if (zone == TimeZone::Local) {
    if (localtime_r(&t, &brokenDown) == nullptr) {
      brokenDown = utcTime(t);
    }
  } else {
    brokenDown = utcTime(t);
  }

  // month names must not depend on global locale
  std::ostringstream stream;
  stream.imbue(std::locale::classic());
  stream << std::put_time(&brokenDown, "%b %e %H:%M:%S");
  return stream.str();
}

TimePoint truncateToMicroseconds(TimePoint timePoint) noexcept {
  return std::chrono::floor<std::chrono::microseconds>(timePoint);
}

std::string formatRfc3339Timestamp(TimePoint timePoint) {
  TimePoint truncated = truncateToMicroseconds(timePoint);
  auto      seconds   = std::chrono::floor<std::chrono::seconds>(truncated);
  long long micros =
      std::chrono::duration_cast<std::chrono::microseconds>(truncated - seconds)
          .count();

  std::tm utc = utcTime(toTimeT(truncated));

  std::string retval =
      (wireFormat("%04d-%02d-%02dT%02d:%02d:%02d") % (utc.tm_year + 1900) %
       (utc.tm_mon + 1) % utc.tm_mday % utc.tm_hour % utc.tm_min % utc.tm_sec)
          .str();

  if (micros != 0) {
    std::string fraction = (wireFormat("%06d") % micros).str();
    fraction.erase(fraction.find_last_not_of('0') + 1);
    retval += '.' + fraction;
  }

  retval += 'Z';
  return retval;
}
} // namespace syslog_fmt
