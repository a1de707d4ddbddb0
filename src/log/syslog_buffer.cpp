#include "syslog_buffer.hpp"

#include <syslog.h>

static_assert(vpsnetd::SYSLOG_CRIT == LOG_CRIT &&
              vpsnetd::SYSLOG_ERR == LOG_ERR &&
              vpsnetd::SYSLOG_WARN == LOG_WARNING &&
              vpsnetd::SYSLOG_INFO == LOG_INFO &&
              vpsnetd::SYSLOG_DEBUG == LOG_DEBUG);

namespace vpsnetd {
SyslogBuffer::SyslogBuffer(const std::string ident, const int facility)
    : facility(facility), next_prio(SYSLOG_DEBUG), ident(ident) {
  openlog(this->ident.c_str(), LOG_PID, facility);
}

int SyslogBuffer::sync() {
  if (buffer.length()) {
    syslog(next_prio, "%s", buffer.c_str());
    buffer.erase();
    next_prio = SYSLOG_DEBUG;
  }
  return 0;
}

int SyslogBuffer::overflow(int c) {
  if (c != std::char_traits<char>::eof()) {
    buffer += static_cast<char>(c);
  } else {
    sync();
  }
  return c;
}

std::ostream &operator<<(std::ostream &os, const SyslogPriority &prio) {
  static_cast<SyslogBuffer *>(os.rdbuf())->next_prio = static_cast<int>(prio);
  return os;
}

std::ostream &syslog_stream() {
  // openlog() keeps a pointer to the ident, so the buffer lives forever
  static SyslogBuffer buffer("vpsnetd", LOG_DAEMON);
  static std::ostream stream(&buffer);
  return stream;
}
} // namespace vpsnetd
