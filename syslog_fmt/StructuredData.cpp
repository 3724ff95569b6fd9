// StructuredData.cpp

#include "StructuredData.hpp"

namespace syslog_fmt {
namespace {
void appendParamValue(std::string       &out,
                      const std::string &value,
                      SdEscaping         escaping) {
  if (escaping == SdEscaping::Verbatim) {
    out += value;
    return;
  }

  for (char c : value) {
    if (c == '"' || c == '\\' || c == ']') {
      out += '\\';
    }
    out += c;
  }
}
} // namespace

std::string encodeStructuredData(const StructuredData &data,
                                 SdEscaping            escaping) {
  if (data.empty()) {
    return NILVALUE;
  }

  std::string retval;
  for (const auto &[id, params] : data) {
    retval += '[';
    retval += id;
    for (const auto &[name, value] : params) {
      retval += ' ';
      retval += name;
      retval += "=\"";
      appendParamValue(retval, value, escaping);
      retval += '"';
    }
    retval += ']';
  }

  return retval;
}
} // namespace syslog_fmt
