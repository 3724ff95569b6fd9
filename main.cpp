// main.cpp

#include "backends/Rfc3164StreamBackend.hpp"
#include "syslog_fmt/FormatError.hpp"
#include "syslog_fmt/Formatter3164.hpp"
#include "syslog_fmt/Formatter5424.hpp"
#include "syslog_fmt/logs.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {
void printUsage(const char *program) {
  std::cerr << "usage: " << program
            << " <3164|5424> <facility> <severity> <message> [msgid]"
            << std::endl;
}
} // namespace

int main(int argc, char *argv[]) {
  if (argc < 5 || argc > 6) {
    printUsage(argv[0]);
    return EXIT_FAILURE;
  }

  const std::string format = argv[1];

  syslog_fmt::Facility facility;
  syslog_fmt::Severity severity;
  try {
    facility = syslog_fmt::facilityFromString(argv[2]);
    severity = syslog_fmt::severityFromString(argv[3]);
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    printUsage(argv[0]);
    return EXIT_FAILURE;
  }

  // diagnostics of the library go to stderr as syslog lines too
  auto diagFrontend = std::make_shared<syslog_fmt::logs::MessageFrontend>();
  auto diagBackend  = std::make_shared<syslog_fmt::Rfc3164StreamBackend>(
      std::cerr,
      syslog_fmt::Formatter3164{syslog_fmt::Facility::Syslog,
                                syslog_fmt::ProcessIdentity{
                                    std::nullopt, "syslog_fmt", 0}});
  SYSLOG_FMT_LOGGER_ADD_SINK(diagFrontend, diagBackend);

  try {
    if (format == "3164") {
      auto formatter = syslog_fmt::Formatter3164::detect(facility);
      formatter.format(std::cout, severity, argv[4]);
    } else if (format == "5424") {
      auto formatter = syslog_fmt::Formatter5424::detect(facility);

      std::optional<std::string> messageId;
      if (argc == 6) {
        messageId = argv[5];
      }
      formatter.format(std::cout,
                       severity,
                       syslog_fmt::Rfc5424Message{messageId, {}, argv[4]});
    } else {
      printUsage(argv[0]);
      return EXIT_FAILURE;
    }
  } catch (const syslog_fmt::FormatError &e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  std::cout << std::endl;

  return EXIT_SUCCESS;
}
