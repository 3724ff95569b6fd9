// Formatter5424.hpp

#pragma once

#include "LogFormat.hpp"
#include "ProcessIdentity.hpp"
#include "StructuredData.hpp"
#include "Timestamp.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace syslog_fmt {
/// maximum length of MSGID field
inline constexpr std::size_t MAX_MESSAGE_ID_LENGTH = 32;

template <typename MessageId>
struct Rfc5424Payload {
  MessageId        messageId;
  StructuredData   data;
  std::string_view message;
};

/// absent message id is printed as NILVALUE
using Rfc5424Message = Rfc5424Payload<std::optional<std::string>>;
/// message id is printed as decimal number
using Rfc5424NumericMessage = Rfc5424Payload<std::uint32_t>;

struct Rfc5424Options {
  SdEscaping escaping = SdEscaping::Verbatim;
  Clock      clock    = systemClock();
};

/**\brief make valid MSGID: NILVALUE for absent id, otherwise only printable
 * US-ASCII characters are kept and result is cut to 32 characters
 * \note present id without printable characters gives empty string, not
 * NILVALUE, so the record gets two spaces in a row on place of MSGID
 */
std::string normalizeMessageId(const std::optional<std::string> &messageId);

/**\brief structured syslog format (RFC5424):
 * `<PRI>1 TIMESTAMP HOSTNAME APP-NAME PROCID MSGID STRUCTURED-DATA MSG`
 *
 * If hostname is absent, then `localhost` is used
 */
class Formatter5424 final : public LogFormat<Rfc5424Message>,
                            public LogFormat<Rfc5424NumericMessage> {
public:
  Formatter5424(Facility        facility,
                ProcessIdentity identity,
                Rfc5424Options  options = {});

  /**\brief create formatter for current process
   * \see detectProcessIdentity
   */
  static Formatter5424 detect(Facility       facility = Facility::User,
                              Rfc5424Options options  = {});

  void format(std::ostream  &sink,
              Severity       severity,
              Rfc5424Message payload) const override;

  /**\brief same as string message id, but the id is number
   */
  void format(std::ostream         &sink,
              Severity              severity,
              Rfc5424NumericMessage payload) const override;

  using LogFormat<Rfc5424Message>::emerg;
  using LogFormat<Rfc5424NumericMessage>::emerg;
  using LogFormat<Rfc5424Message>::alert;
  using LogFormat<Rfc5424NumericMessage>::alert;
  using LogFormat<Rfc5424Message>::crit;
  using LogFormat<Rfc5424NumericMessage>::crit;
  using LogFormat<Rfc5424Message>::err;
  using LogFormat<Rfc5424NumericMessage>::err;
  using LogFormat<Rfc5424Message>::warning;
  using LogFormat<Rfc5424NumericMessage>::warning;
  using LogFormat<Rfc5424Message>::notice;
  using LogFormat<Rfc5424NumericMessage>::notice;
  using LogFormat<Rfc5424Message>::info;
  using LogFormat<Rfc5424NumericMessage>::info;
  using LogFormat<Rfc5424Message>::debug;
  using LogFormat<Rfc5424NumericMessage>::debug;

  /**\brief encode structured data with escaping of the formatter
   */
  std::string formatStructuredData(const StructuredData &data) const;

  Facility facility() const noexcept {
    return facility_;
  }

  const ProcessIdentity &identity() const noexcept {
    return identity_;
  }

  SdEscaping escaping() const noexcept {
    return escaping_;
  }

private:
  Facility        facility_;
  ProcessIdentity identity_;
  SdEscaping      escaping_;
  Clock           clock_;
};
} // namespace syslog_fmt
