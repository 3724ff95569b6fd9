// Rfc3164StreamBackend.cpp

#include "Rfc3164StreamBackend.hpp"
#include <ios>
#include <iostream>
#include <syslog_fmt/FormatError.hpp>
#include <utility>

namespace syslog_fmt {
Rfc3164StreamBackend::Rfc3164StreamBackend(std::ostream &stream,
                                           Formatter3164 formatter)
    : stream_{stream}
    , formatter_{std::move(formatter)} {
}

void Rfc3164StreamBackend::consume(Severity         severity,
                                   std::string_view record) noexcept {
  std::lock_guard<std::mutex> lock{mutex_};
  try {
    formatter_.format(stream_, severity, record);
    writeRecord(stream_, "\n");
    stream_.flush();
  } catch (const FormatError &e) {
    // XXX we can not log the error, because we are inside of logger
    std::cerr << e.what() << ": " << record << std::endl;
  } catch (const std::ios_base::failure &e) {
    std::cerr << "failed to flush syslog record: " << e.what() << std::endl;
  }
}
} // namespace syslog_fmt
