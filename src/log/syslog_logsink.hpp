#pragma once

#include <sstream>

#include "logsink.hpp"
#include "syslog_buffer.hpp"

namespace vpsnetd {
class SyslogLogSink : public LogSink {
private:
  std::ostream &stream;

  virtual std::string format_message(const std::string &msg,
                                     Level level) const override {
    switch (level) {
    case TRACE:
      stream << SYSLOG_DEBUG;
      break;
    case DEBUG: // debug is default level
      break;
    case WARN:
      stream << SYSLOG_WARN;
      break;
    case ERROR:
      stream << SYSLOG_ERR;
      break;
    case FATAL:
      stream << SYSLOG_CRIT;
      break;
    case INFO:
    default:
      stream << SYSLOG_INFO;
      break;
    }

    return msg;
  }

public:
  SyslogLogSink() : LogSink(syslog_stream()), stream(syslog_stream()) {}
  ~SyslogLogSink() {}
};
} // namespace vpsnetd
