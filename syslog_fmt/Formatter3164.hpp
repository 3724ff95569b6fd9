// Formatter3164.hpp

#pragma once

#include "LogFormat.hpp"
#include "ProcessIdentity.hpp"
#include "Timestamp.hpp"
#include <string_view>

namespace syslog_fmt {
struct Rfc3164Options {
  /// zone of TIMESTAMP field, RFC3164 expects local time
  TimeZone timeZone = TimeZone::Local;
  Clock    clock    = systemClock();
};

/**\brief BSD syslog format (RFC3164):
 * `<PRI>Mmm dd hh:mm:ss HOSTNAME PROCESS[PID]: MESSAGE`
 *
 * If hostname is absent, then the field is omitted with its space
 */
class Formatter3164 final : public LogFormat<std::string_view> {
public:
  Formatter3164(Facility        facility,
                ProcessIdentity identity,
                Rfc3164Options  options = {});

  /**\brief create formatter for current process
   * \see detectProcessIdentity
   */
  static Formatter3164 detect(Facility       facility = Facility::User,
                              Rfc3164Options options  = {});

  void format(std::ostream    &sink,
              Severity         severity,
              std::string_view message) const override;

  Facility facility() const noexcept {
    return facility_;
  }

  const ProcessIdentity &identity() const noexcept {
    return identity_;
  }

  TimeZone timeZone() const noexcept {
    return timeZone_;
  }

private:
  Facility        facility_;
  ProcessIdentity identity_;
  TimeZone        timeZone_;
  Clock           clock_;
};
} // namespace syslog_fmt
