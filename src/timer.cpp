#include "timer.hpp"

#include <string.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <stdexcept>

#include "log/logger.hpp"
#include "string-format.hpp"

namespace vpsnetd {
IntervalTimer::IntervalTimer(std::chrono::milliseconds interval,
                             TimerObserver &observer)
    : observer(observer) {
  timer_fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
  if (timer_fd == -1) {
    die("Failed to create timer: ");
  }

  const auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(interval);
  const auto nanoseconds =
      std::chrono::duration_cast<std::chrono::nanoseconds>(interval - seconds);
  struct timespec period {
    .tv_sec = seconds.count(), .tv_nsec = nanoseconds.count()
  };
  struct itimerspec timer_cfg {
    .it_interval = period, .it_value = period
  };
  if (timerfd_settime(timer_fd, 0, &timer_cfg, nullptr) == -1) {
    close(timer_fd);
    die("Failed to arm timer: ");
  }
  LOG_DEBUG(string_format("Ticking every %lld ms",
                          static_cast<long long>(interval.count())));
}

IntervalTimer::~IntervalTimer() noexcept { close(timer_fd); }

IntervalTimer::operator int() { return timer_fd; }

void IntervalTimer::die(std::string error_msg) {
  error_msg.append(strerror(errno));
  LOG_FATAL(error_msg);
  throw std::runtime_error(error_msg);
}

void IntervalTimer::handle_epollin() {
  uint64_t expirations = 0;
  if (read(timer_fd, &expirations, sizeof(expirations)) !=
      sizeof(expirations)) {
    if (errno == EAGAIN || errno == EINTR) {
      return;
    }
    die("Failed to read timer: ");
  }
  if (expirations > 1) {
    LOG_TRACE(string_format("Missed %llu ticks",
                            static_cast<unsigned long long>(expirations - 1)));
  }
  observer.handle_tick();
}

void IntervalTimer::handle_hangup() { observer.handle_hangup(); }
} // namespace vpsnetd
