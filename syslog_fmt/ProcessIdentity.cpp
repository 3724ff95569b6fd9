// ProcessIdentity.cpp

#include "ProcessIdentity.hpp"
#include "logs.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace syslog_fmt {
namespace {
std::optional<std::string> detectHostname() {
  // HOST_NAME_MAX is 64 on linux, but names from other systems can be longer
  std::array<char, 256> buf{};
  if (gethostname(buf.data(), buf.size() - 1) != 0) {
    SYSLOG_FMT_LOG_DEBUG("can not detect hostname: %1%", std::strerror(errno));
    return std::nullopt;
  }

  std::string hostname{buf.data()};
  if (hostname.empty()) {
    SYSLOG_FMT_LOG_DEBUG("hostname is empty");
    return std::nullopt;
  }

  return hostname;
}

std::string detectProcessName() {
  std::error_code       error;
  std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe",
                                                            error);
  if (error) {
    SYSLOG_FMT_LOG_DEBUG("can not detect executable: %1%", error.message());
    return {};
  }

  return exe.filename().string();
}
} // namespace

ProcessIdentity detectProcessIdentity() {
  ProcessIdentity retval;
  retval.hostname = detectHostname();
  retval.process  = detectProcessName();
  retval.pid      = static_cast<std::uint32_t>(getpid());
  return retval;
}
} // namespace syslog_fmt
