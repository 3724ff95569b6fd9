// Timestamp.hpp

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace syslog_fmt {
using TimePoint = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::nanoseconds>;

/**\brief source of timestamps for formatters.
 * \note must be callable from several threads if formatter is shared
 * \warning must not throw: exceptions go through `format` to the caller, and
 * in Rfc3164StreamBackend::consume (noexcept) they call std::terminate
 */
using Clock = std::function<TimePoint()>;

/**\return clock which reads std::chrono::system_clock
 */
Clock systemClock();

enum class TimeZone { Local, Utc };

/**\brief RFC3164 TIMESTAMP, like `Oct  9 22:14:15`
 * \note if local time can not be determined then UTC is used
 */
std::string formatRfc3164Timestamp(TimePoint timePoint, TimeZone zone);

/**\brief floor to whole microseconds, because RFC5424 allows not more then 6
 * digits of second fraction
 */
TimePoint truncateToMicroseconds(TimePoint timePoint) noexcept;

/**\brief RFC3339 UTC timestamp, like `2003-10-11T22:14:15.003Z`. Fraction is
 * truncated to microseconds and printed without trailing zeros
 */
std::string formatRfc3339Timestamp(TimePoint timePoint);
} // namespace syslog_fmt
