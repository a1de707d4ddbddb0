#pragma once

// adapted from
// https://stackoverflow.com/questions/2638654/redirect-c-stdclog-to-syslog-on-unix

#include <ostream>
#include <streambuf>
#include <string>

namespace vpsnetd {
// <syslog.h> stays out of headers, its LOG_* macros clash with the logger
enum SyslogPriority {
  SYSLOG_EMERG = 0,  // system is unusable
  SYSLOG_ALERT = 1,  // action must be taken immediately
  SYSLOG_CRIT = 2,   // critical conditions
  SYSLOG_ERR = 3,    // error conditions
  SYSLOG_WARN = 4,   // warning conditions
  SYSLOG_NOTICE = 5, // normal, but significant, condition
  SYSLOG_INFO = 6,   // informational message
  SYSLOG_DEBUG = 7   // debug-level message
};

std::ostream &operator<<(std::ostream &os, const SyslogPriority &log_priority);

class SyslogBuffer : public std::basic_streambuf<char, std::char_traits<char>> {
public:
  explicit SyslogBuffer(const std::string ident, const int facility);

protected:
  int sync();
  int overflow(int c);

private:
  friend std::ostream &operator<<(std::ostream &os,
                                  const SyslogPriority &log_priority);
  std::string buffer;
  int facility;
  int next_prio;
  std::string ident;
};

std::ostream &syslog_stream();
} // namespace vpsnetd
