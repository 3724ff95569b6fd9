// WireFormat.hpp

#pragma once

#include <boost/format.hpp>
#include <locale>

namespace syslog_fmt {
/**\return format object for fields of syslog record. It uses classic locale,
 * so global locale of application can not add grouping to numbers like pid
 */
inline boost::format wireFormat(const char *layout) {
  return boost::format{layout, std::locale::classic()};
}
} // namespace syslog_fmt
