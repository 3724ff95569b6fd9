// logs.hpp
/**\file
 * Diagnostics of syslog_fmt itself. By default logger has no sinks, so all
 * records are dropped. For get records you need create frontend and backend
 * and call SYSLOG_FMT_LOGGER_ADD_SINK with them. You can use
 * syslog_fmt::logs::StandardFrontend and syslog_fmt::logs::TextStreamBackend,
 * or syslog_fmt::Rfc3164StreamBackend if you want get records as syslog lines
 *
 * You can set your own format for StandardFrontend records. For do it you
 * need define `SYSLOG_FMT_DIAG_FORMAT` macro as c-string. The string can
 * contains 5 items defined by:
 *
 * - `SYSLOG_FMT_SEVERITY`
 * - `SYSLOG_FMT_FILE_NAME`
 * - `SYSLOG_FMT_LINE_NUMBER`
 * - `SYSLOG_FMT_FUNCTION_NAME`
 * - `SYSLOG_FMT_MESSAGE`
 *
 * \warning add all sinks before using formatters from several threads. Logger
 * doesn't synchronize its list of sinks
 */

#pragma once

#include "Priority.hpp"
#include <boost/format.hpp>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

// All args set in specific order for formatting
#define SYSLOG_FMT_SEVERITY      "%1%"
#define SYSLOG_FMT_FILE_NAME     "%2%"
#define SYSLOG_FMT_LINE_NUMBER   "%3%"
#define SYSLOG_FMT_FUNCTION_NAME "%4%"
#define SYSLOG_FMT_MESSAGE       "%5%"

#ifndef SYSLOG_FMT_DIAG_FORMAT
#  define SYSLOG_FMT_DIAG_FORMAT                                               \
    SYSLOG_FMT_SEVERITY " " SYSLOG_FMT_FILE_NAME ":" SYSLOG_FMT_LINE_NUMBER    \
                        " " SYSLOG_FMT_FUNCTION_NAME " | " SYSLOG_FMT_MESSAGE
#endif

namespace syslog_fmt::logs {
using Filter = std::function<bool(Severity)>;

/**\return filter which accepts records with severity not less important then
 * `threshold`, so `Severity::Warning` accepts Emerg..Warning
 */
inline Filter atLeast(Severity threshold) {
  return [threshold](Severity input) {
    return static_cast<int>(input) <= static_cast<int>(threshold);
  };
}

/**\return safety format object for user message
 */
inline boost::format getLogFormat(std::string_view format) {
  boost::format retval{std::string{format}};
  retval.exceptions(boost::io::all_error_bits ^ (boost::io::too_few_args_bit |
                                                 boost::io::too_many_args_bit));
  return retval;
}

/**\brief help function for combine all user arguments in one message
 */
template <typename... Args>
boost::format doFormat(boost::format format, Args... args) {
  return (format % ... % args);
}

/**\brief formatting user message
 */
template <typename... Args>
boost::format messageHandler(std::string_view messageFormat, Args... args) {
  boost::format format = getLogFormat(messageFormat);
  return doFormat(std::move(format), args...);
}

class BasicFrontend {
public:
  BasicFrontend()
      : filter_{atLeast(Severity::Debug)} {
  }
  virtual ~BasicFrontend() = default;

  virtual std::string makeRecord(Severity         severity,
                                 std::string_view fileName,
                                 int              lineNumber,
                                 std::string_view functionName,
                                 boost::format    message) const = 0;

  /**\throw exception if filter is empty
   */
  void setFilter(Filter filter) noexcept(false) {
    if (!filter) {
      throw std::invalid_argument{"invalid severity filter"};
    }

    filter_ = std::move(filter);
  }

  bool accept(Severity severity) const {
    return filter_(severity);
  }

private:
  Filter filter_;
};

class StandardFrontend final : public BasicFrontend {
public:
  std::string makeRecord(Severity         severity,
                         std::string_view fileName,
                         int              lineNumber,
                         std::string_view functionName,
                         boost::format    message) const override {
    boost::format recordFormat{SYSLOG_FMT_DIAG_FORMAT};
    recordFormat.exceptions(boost::io::all_error_bits ^
                            boost::io::too_many_args_bit);

    recordFormat % toString(severity) % fileName % lineNumber % functionName %
        message;

    return recordFormat.str();
  }
};

/**\brief only user message, for backends which add their own header
 */
class MessageFrontend final : public BasicFrontend {
public:
  std::string makeRecord(Severity,
                         std::string_view,
                         int,
                         std::string_view,
                         boost::format message) const override {
    return message.str();
  }
};

class BasicBackend {
public:
  virtual ~BasicBackend() = default;

  /**\brief get record from frontend
   * \note that this function can call from several threads, so you need prevent
   * data race by using mutex
   */
  virtual void consume(Severity severity, std::string_view record) noexcept = 0;
};

class TextStreamBackend final : public BasicBackend {
public:
  explicit TextStreamBackend(std::ostream &stream)
      : stream_{stream} {
  }

  /**\note uses mutex
   */
  void consume(Severity, std::string_view record) noexcept override {
    std::lock_guard<std::mutex> lock{mutex_};
    stream_ << record << std::endl;
  }

private:
  std::ostream &stream_;
  std::mutex    mutex_;
};

struct Sink {
  std::shared_ptr<BasicFrontend> frontend;
  std::shared_ptr<BasicBackend>  backend;
};

class Logger {
public:
  void log(Severity         severity,
           std::string_view fileName,
           int              lineNumber,
           std::string_view functionName,
           boost::format    message) {
    for (Sink &sink : sinks_) {
      if (sink.frontend->accept(severity)) {
        std::string record = sink.frontend->makeRecord(severity,
                                                       fileName,
                                                       lineNumber,
                                                       functionName,
                                                       message);
        sink.backend->consume(severity, record);
      }
    }
  }

  /**\throw exception if frontend or backend are invalid
   */
  void addSink(Sink sink) noexcept(false) {
    if (sink.frontend == nullptr) {
      throw std::invalid_argument{"invalid logger frontend"};
    }
    if (sink.backend == nullptr) {
      throw std::invalid_argument{"invalid logger backend"};
    }

    sinks_.emplace_back(std::move(sink));
  }

  void removeSinks() noexcept {
    sinks_.clear();
  }

  static Logger &get() noexcept {
    static Logger logger;
    return logger;
  }

private:
  Logger() noexcept {
  }

  Logger(const Logger &) = delete;
  Logger(Logger &&)      = delete;

private:
  std::list<Sink> sinks_;
};
} // namespace syslog_fmt::logs

#define SYSLOG_FMT_LOGGER syslog_fmt::logs::Logger::get()

/**\brief add new sink for logger
 * \warning do it before formatters are used from several threads
 */
#define SYSLOG_FMT_LOGGER_ADD_SINK(frontend, backend)                          \
  SYSLOG_FMT_LOGGER.addSink(syslog_fmt::logs::Sink{frontend, backend})

#ifndef SYSLOG_FMT_LOG_FORMAT
#  define SYSLOG_FMT_LOG_FORMAT(severity, message)                             \
    SYSLOG_FMT_LOGGER.log(severity, __FILE__, __LINE__, __func__, message);
#endif

#ifndef SYSLOG_FMT_LOG_DEBUG
#  define SYSLOG_FMT_LOG_DEBUG(...)                                            \
    SYSLOG_FMT_LOG_FORMAT(syslog_fmt::Severity::Debug,                         \
                          syslog_fmt::logs::messageHandler(__VA_ARGS__))
#endif

#ifndef SYSLOG_FMT_LOG_INFO
#  define SYSLOG_FMT_LOG_INFO(...)                                             \
    SYSLOG_FMT_LOG_FORMAT(syslog_fmt::Severity::Info,                          \
                          syslog_fmt::logs::messageHandler(__VA_ARGS__))
#endif

#ifndef SYSLOG_FMT_LOG_WARNING
#  define SYSLOG_FMT_LOG_WARNING(...)                                          \
    SYSLOG_FMT_LOG_FORMAT(syslog_fmt::Severity::Warning,                       \
                          syslog_fmt::logs::messageHandler(__VA_ARGS__))
#endif

#ifndef SYSLOG_FMT_LOG_ERROR
#  define SYSLOG_FMT_LOG_ERROR(...)                                            \
    SYSLOG_FMT_LOG_FORMAT(syslog_fmt::Severity::Err,                           \
                          syslog_fmt::logs::messageHandler(__VA_ARGS__))
#endif
