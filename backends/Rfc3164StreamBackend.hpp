// Rfc3164StreamBackend.hpp

#pragma once

#include <mutex>
#include <ostream>
#include <syslog_fmt/Formatter3164.hpp>
#include <syslog_fmt/logs.hpp>

namespace syslog_fmt {
/**\brief diagnostics backend which writes every record as RFC3164 line, one
 * record per line
 */
class Rfc3164StreamBackend final : public logs::BasicBackend {
public:
  Rfc3164StreamBackend(std::ostream &stream, Formatter3164 formatter);

  /**\note uses mutex. If stream failed, then record is reported to std::cerr
   */
  void consume(Severity severity, std::string_view record) noexcept override;

private:
  std::ostream &stream_;
  Formatter3164 formatter_;
  std::mutex    mutex_;
};
} // namespace syslog_fmt
