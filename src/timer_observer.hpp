#pragma once

namespace vpsnetd {

class TimerObserver {
public:
  virtual ~TimerObserver(){};

  virtual void handle_tick() = 0;
  virtual void handle_hangup() = 0;
};
} // namespace vpsnetd
