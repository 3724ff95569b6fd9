// StructuredData.hpp

#pragma once

#include <string>
#include <unordered_map>

namespace syslog_fmt {
/// value of RFC5424 field which is not present
inline constexpr char NILVALUE[] = "-";

/**\brief RFC5424 STRUCTURED-DATA: SD-ID -> (PARAM-NAME -> PARAM-VALUE)
 * \note order of elements and params is not significant
 */
using StructuredData =
    std::unordered_map<std::string,
                       std::unordered_map<std::string, std::string>>;

enum class SdEscaping {
  /// values are inserted as is, caller is responsible for valid content
  Verbatim,
  /// `"`, `\` and `]` in values are escaped by backslash
  Strict
};

/**\return `-` for empty data, otherwise `[id name="value"...]...`
 */
std::string encodeStructuredData(const StructuredData &data,
                                 SdEscaping escaping = SdEscaping::Verbatim);
} // namespace syslog_fmt
