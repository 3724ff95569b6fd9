// LogFormat.hpp

#pragma once

#include "Priority.hpp"
#include <ostream>
#include <utility>

namespace syslog_fmt {
/**\brief common interface of syslog formatters.
 *
 * Formatter implements it once for every kind of payload which it can accept.
 * Only `format` must be implemented, all other methods are shortcuts for
 * specific severity
 *
 * \note formatters must not change their state in `format`, so one formatter
 * can be used from several threads if every thread writes to its own sink
 */
template <typename Payload>
class LogFormat {
public:
  virtual ~LogFormat() = default;

  /**\brief write one record (without new line) to sink
   * \throw FormatError if writing to sink failed
   */
  virtual void
  format(std::ostream &sink, Severity severity, Payload payload) const = 0;

  void emerg(std::ostream &sink, Payload payload) const {
    format(sink, Severity::Emerg, std::move(payload));
  }

  void alert(std::ostream &sink, Payload payload) const {
    format(sink, Severity::Alert, std::move(payload));
  }

  void crit(std::ostream &sink, Payload payload) const {
    format(sink, Severity::Crit, std::move(payload));
  }

  void err(std::ostream &sink, Payload payload) const {
    format(sink, Severity::Err, std::move(payload));
  }

  void warning(std::ostream &sink, Payload payload) const {
    format(sink, Severity::Warning, std::move(payload));
  }

  void notice(std::ostream &sink, Payload payload) const {
    format(sink, Severity::Notice, std::move(payload));
  }

  void info(std::ostream &sink, Payload payload) const {
    format(sink, Severity::Info, std::move(payload));
  }

  void debug(std::ostream &sink, Payload payload) const {
    format(sink, Severity::Debug, std::move(payload));
  }
};
} // namespace syslog_fmt
