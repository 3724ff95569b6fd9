// ProcessIdentity.hpp

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace syslog_fmt {
/**\brief identity of the logging process, which goes to every syslog record
 */
struct ProcessIdentity {
  /// missing hostname is valid, formatters handle it
  std::optional<std::string> hostname;
  /// APP-NAME in RFC5424
  std::string   process;
  std::uint32_t pid = 0;
};

/**\brief detect hostname, executable name and pid of current process.
 *
 * Never fails: if hostname can not be detected it will be empty, if
 * executable name can not be detected then process will be empty string
 */
ProcessIdentity detectProcessIdentity();
} // namespace syslog_fmt
