// FormatError.cpp

#include "FormatError.hpp"
#include <ios>

namespace syslog_fmt {
void writeRecord(std::ostream &sink, std::string_view record) noexcept(false) {
  try {
    sink.write(record.data(), static_cast<std::streamsize>(record.size()));
  } catch (const std::ios_base::failure &e) {
    throw FormatError{e.code()};
  }

  if (!sink) {
    throw FormatError{std::make_error_code(std::io_errc::stream)};
  }
}
} // namespace syslog_fmt
