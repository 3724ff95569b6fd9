// FormatError.hpp

#pragma once

#include <ostream>
#include <stdexcept>
#include <string_view>
#include <system_error>

namespace syslog_fmt {
/**\brief the only error of formatting: record could not be written to sink
 */
class FormatError final : public std::runtime_error {
public:
  explicit FormatError(std::error_code cause)
      : std::runtime_error{"failed to write syslog record: " + cause.message()}
      , cause_{cause} {
  }

  /**\return io error which caused failure
   */
  const std::error_code &code() const noexcept {
    return cause_;
  }

private:
  std::error_code cause_;
};

/**\brief write full record to the sink. Doesn't flush the sink
 * \throw FormatError if the stream failed or throws std::ios_base::failure
 */
void writeRecord(std::ostream &sink, std::string_view record) noexcept(false);
} // namespace syslog_fmt
