// Priority.hpp
/**\file
 * Severity and facility codes of syslog and their combination to the PRI
 * value, which is the first field of both RFC3164 and RFC5424 messages
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace syslog_fmt {
/**\brief severity levels as defined in RFC5424 Table 2
 */
enum class Severity : std::uint8_t {
  Emerg   = 0,
  Alert   = 1,
  Crit    = 2,
  Err     = 3,
  Warning = 4,
  Notice  = 5,
  Info    = 6,
  Debug   = 7
};

/**\brief facility codes, already shifted to their place in PRI like
 * `LOG_USER` and others from `<syslog.h>`
 */
enum class Facility : std::uint8_t {
  Kern     = 0 << 3,
  User     = 1 << 3,
  Mail     = 2 << 3,
  Daemon   = 3 << 3,
  Auth     = 4 << 3,
  Syslog   = 5 << 3,
  Lpr      = 6 << 3,
  News     = 7 << 3,
  Uucp     = 8 << 3,
  Cron     = 9 << 3,
  Authpriv = 10 << 3,
  Ftp      = 11 << 3,
  Ntp      = 12 << 3,
  Audit    = 13 << 3,
  Alert    = 14 << 3,
  Clock    = 15 << 3,
  Local0   = 16 << 3,
  Local1   = 17 << 3,
  Local2   = 18 << 3,
  Local3   = 19 << 3,
  Local4   = 20 << 3,
  Local5   = 21 << 3,
  Local6   = 22 << 3,
  Local7   = 23 << 3
};

using Priority = std::uint8_t;

constexpr Priority encodePriority(Severity severity,
                                  Facility facility) noexcept {
  return static_cast<Priority>(static_cast<std::uint8_t>(facility) |
                               static_cast<std::uint8_t>(severity));
}

/**\return true for characters which RFC5424 calls PRINTUSASCII, so 33..126
 */
constexpr bool isPrintUsAscii(char32_t c) noexcept {
  return 33 <= c && c <= 126;
}

std::string toString(Severity severity);
std::string toString(Facility facility);

/**\brief parse facility by its conventional name, like `local3`
 * \throw std::invalid_argument if the name is unknown
 */
Facility facilityFromString(std::string_view name) noexcept(false);

/**\brief parse severity by the name returned from toString, like `warning`
 * \throw std::invalid_argument if the name is unknown
 */
Severity severityFromString(std::string_view name) noexcept(false);
} // namespace syslog_fmt
