// Formatter5424.cpp

#include "Formatter5424.hpp"
#include "FormatError.hpp"
#include "WireFormat.hpp"
#include <utility>

namespace syslog_fmt {
namespace {
/// value of HOSTNAME if hostname of process is unknown
constexpr char DEFAULT_HOSTNAME[] = "localhost";
/// VERSION field
constexpr unsigned PROTOCOL_VERSION = 1;
} // namespace

std::string normalizeMessageId(const std::optional<std::string> &messageId) {
  if (!messageId) {
    return NILVALUE;
  }

  // filter first, so skipped characters don't take place in the limit
  std::string retval;
  for (char c : *messageId) {
    if (retval.size() == MAX_MESSAGE_ID_LENGTH) {
      break;
    }
    if (isPrintUsAscii(static_cast<unsigned char>(c))) {
      retval += c;
    }
  }

  return retval;
}

Formatter5424::Formatter5424(Facility        facility,
                             ProcessIdentity identity,
                             Rfc5424Options  options)
    : facility_{facility}
    , identity_{std::move(identity)}
    , escaping_{options.escaping}
    , clock_{options.clock ? std::move(options.clock) : systemClock()} {
}

Formatter5424 Formatter5424::detect(Facility facility, Rfc5424Options options) {
  return Formatter5424{facility, detectProcessIdentity(), std::move(options)};
}

std::string Formatter5424::formatStructuredData(
    const StructuredData &data) const {
  return encodeStructuredData(data, escaping_);
}

void Formatter5424::format(std::ostream  &sink,
                           Severity       severity,
                           Rfc5424Message payload) const {
  std::string messageId = normalizeMessageId(payload.messageId);
  unsigned    priority  = encodePriority(severity, facility_);

  boost::format record =
      wireFormat("<%1%>%2% %3% %4% %5% %6% %7% %8% %9%");
  record % priority % PROTOCOL_VERSION % formatRfc3339Timestamp(clock_()) %
      identity_.hostname.value_or(DEFAULT_HOSTNAME) % identity_.process %
      identity_.pid % messageId % formatStructuredData(payload.data) %
      payload.message;

  writeRecord(sink, record.str());
}

void Formatter5424::format(std::ostream         &sink,
                           Severity              severity,
                           Rfc5424NumericMessage payload) const {
  format(sink,
         severity,
         Rfc5424Message{std::to_string(payload.messageId),
                        std::move(payload.data),
                        payload.message});
}
} // namespace syslog_fmt
