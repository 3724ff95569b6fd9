// Priority.cpp

#include "Priority.hpp"
#include <array>
#include <stdexcept>
#include <utility>

namespace syslog_fmt {
namespace {
using FacilityName = std::pair<std::string_view, Facility>;

constexpr std::array<FacilityName, 24> facilityNames{{
    {"kern", Facility::Kern},         {"user", Facility::User},
    {"mail", Facility::Mail},         {"daemon", Facility::Daemon},
    {"auth", Facility::Auth},         {"syslog", Facility::Syslog},
    {"lpr", Facility::Lpr},           {"news", Facility::News},
    {"uucp", Facility::Uucp},         {"cron", Facility::Cron},
    {"authpriv", Facility::Authpriv}, {"ftp", Facility::Ftp},
    {"ntp", Facility::Ntp},           {"audit", Facility::Audit},
    {"alert", Facility::Alert},       {"clock", Facility::Clock},
    {"local0", Facility::Local0},     {"local1", Facility::Local1},
    {"local2", Facility::Local2},     {"local3", Facility::Local3},
    {"local4", Facility::Local4},     {"local5", Facility::Local5},
    {"local6", Facility::Local6},     {"local7", Facility::Local7},
}};
} // namespace

std::string toString(Severity severity) {
  switch (severity) {
  case Severity::Emerg:
    return "emerg";
  case Severity::Alert:
    return "alert";
  case Severity::Crit:
    return "crit";
  case Severity::Err:
    return "err";
  case Severity::Warning:
    return "warning";
  case Severity::Notice:
    return "notice";
  case Severity::Info:
    return "info";
  case Severity::Debug:
    return "debug";

  default:
    throw std::invalid_argument{"unknown syslog severity"};
  }
}

std::string toString(Facility facility) {
  for (const auto &[name, value] : facilityNames) {
    if (value == facility) {
      return std::string{name};
    }
  }

  throw std::invalid_argument{"unknown syslog facility"};
}

Facility facilityFromString(std::string_view name) noexcept(false) {
  for (const auto &[facilityName, value] : facilityNames) {
    if (facilityName == name) {
      return value;
    }
  }

  throw std::invalid_argument{"unknown syslog facility: " + std::string{name}};
}

Severity severityFromString(std::string_view name) noexcept(false) {
  for (int code = 0; code <= static_cast<int>(Severity::Debug); ++code) {
    auto severity = static_cast<Severity>(code);
    if (toString(severity) == name) {
      return severity;
    }
  }

  throw std::invalid_argument{"unknown syslog severity: " + std::string{name}};
}
} // namespace syslog_fmt
