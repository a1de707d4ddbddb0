#pragma once

#include <chrono>
#include <string>

#include "timer_observer.hpp"

namespace vpsnetd {
class IntervalTimer {
private:
  int timer_fd;
  TimerObserver &observer;
  [[noreturn]] void die(std::string error_msg);

public:
  IntervalTimer(std::chrono::milliseconds interval, TimerObserver &observer);
  ~IntervalTimer() noexcept;
  IntervalTimer(const IntervalTimer &other) = delete;
  IntervalTimer &operator=(const IntervalTimer &other) = delete;

  operator int();
  void handle_epollin();
  void handle_hangup();
};
} // namespace vpsnetd
