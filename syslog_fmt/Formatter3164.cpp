// Formatter3164.cpp

#include "Formatter3164.hpp"
#include "FormatError.hpp"
#include "WireFormat.hpp"
#include <utility>

namespace syslog_fmt {
Formatter3164::Formatter3164(Facility        facility,
                             ProcessIdentity identity,
                             Rfc3164Options  options)
    : facility_{facility}
    , identity_{std::move(identity)}
    , timeZone_{options.timeZone}
    , clock_{options.clock ? std::move(options.clock) : systemClock()} {
}

Formatter3164 Formatter3164::detect(Facility facility, Rfc3164Options options) {
  return Formatter3164{facility, detectProcessIdentity(), std::move(options)};
}

void Formatter3164::format(std::ostream    &sink,
                           Severity         severity,
                           std::string_view message) const {
  // priority is uint8_t, so it must be printed as number, not as char
  unsigned    priority  = encodePriority(severity, facility_);
  std::string timestamp = formatRfc3164Timestamp(clock_(), timeZone_);

  boost::format record;
  if (identity_.hostname) {
    record = wireFormat("<%1%>%2% %3% %4%[%5%]: %6%") % priority %
             timestamp % *identity_.hostname % identity_.process %
             identity_.pid % message;
  } else {
    record = wireFormat("<%1%>%2% %3%[%4%]: %5%") % priority % timestamp %
             identity_.process % identity_.pid % message;
  }

  writeRecord(sink, record.str());
}
} // namespace syslog_fmt
