#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "child_process.hpp"
#include "configuration.hpp"
#include "diff.hpp"
#include "epoll.hpp"
#include "netlink_socket.hpp"
#include "template.hpp"
#include "timer.hpp"
#include "timer_observer.hpp"

namespace vpsnetd {
constexpr std::chrono::milliseconds TICK_INTERVAL{1000};
constexpr std::chrono::seconds UPDATE_INTERVAL{5};
// time the servers get before they are told to reread their configuration
constexpr std::chrono::seconds RELOAD_DELAY{10};

const std::string KEA_PIDFILE_DIR = "/run";
const std::string PID_FILE_PATH = "/run/vpsnetd.pid";

void sighandler(int signum);

class Daemon : TimerObserver {
private:
  std::string confpath;
  std::string template_dir;
  NetworkConfiguration network;
  NetlinkSocket netlink;
  Template kea_template;
  Template radvd_template;
  std::string kea_config_path;
  std::string radvd_config_path;
  std::string kea_path;
  std::string radvd_path;
  std::unique_ptr<ChildProcess> kea;
  std::unique_ptr<ChildProcess> radvd;
  IntervalTimer timer;
  Epoll<IntervalTimer> epoll_timer;
  Clock::time_point next_update;
  std::optional<Clock::time_point> pending_reload;
  // set by a reload so the next pass renders the new templates
  bool force_render;

  bool update(bool render);
  void start_children();

public:
  explicit Daemon(const ProgramConfiguration &optval);
  virtual ~Daemon() {}
  void daemonize(const DAEMON_TYPE type);
  // The first pass must succeed, its errors are passed on to the caller.
  void initial_update();
  void main_loop();
  void shutdown();
  virtual void handle_tick() override;
  virtual void handle_hangup() override;
};

} // namespace vpsnetd
