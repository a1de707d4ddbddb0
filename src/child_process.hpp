#pragma once

#include <sys/types.h>

#include <chrono>
#include <string>
#include <vector>

namespace vpsnetd {
using Clock = std::chrono::steady_clock;

constexpr std::chrono::seconds CHILD_RESTART_DELAY{5};

// Keeps one external program (kea-dhcp4, radvd) running. The program is
// started CHILD_RESTART_DELAY after construction and again after every exit.
class ChildProcess {
private:
  std::string _name;
  std::vector<std::string> _arguments;
  std::vector<std::string> _environment;
  pid_t _pid;
  Clock::time_point _next_start;
  void spawn(Clock::time_point now);

public:
  // arguments[0] is the path of the program, environment holds additional
  // KEY=VALUE pairs on top of the daemon's own environment.
  ChildProcess(const std::string &name, const std::vector<std::string> &arguments,
               const std::vector<std::string> &environment = {},
               Clock::time_point first_start = Clock::now() +
                                               CHILD_RESTART_DELAY);
  ~ChildProcess() noexcept;
  ChildProcess(const ChildProcess &other) = delete;
  ChildProcess &operator=(const ChildProcess &other) = delete;

  // Reaps an exited child and starts it when its restart delay has passed.
  void supervise(Clock::time_point now);
  // Returns true if the child exited since the last call.
  bool reap(Clock::time_point now);
  // Sends SIGHUP so the program rereads its configuration.
  void reload();
  // Sends SIGTERM and waits for the child to exit.
  void stop();

  bool running() const { return _pid != 0; }
  pid_t pid() const { return _pid; }
  const std::string &name() const { return _name; }
};
} // namespace vpsnetd
