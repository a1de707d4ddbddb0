#include "daemon.hpp"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <linux/close_range.h>
#include <signal.h>
#include <sys/capability.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#include "config_writer.hpp"
#include "log/logger.hpp"
#include "network_state.hpp"
#include "string-format.hpp"
#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace vpsnetd {
volatile std::sig_atomic_t last_signal;
volatile std::sig_atomic_t stop_requested;

void sighandler(int signum) {
  if (signum == SIGINT || signum == SIGTERM) {
    vpsnetd::stop_requested = 1;
  } else {
    vpsnetd::last_signal = signum;
  }
}

Daemon::Daemon(const ProgramConfiguration &optval)
    : confpath(optval.confpath), template_dir(optval.template_dir),
      network(optval.network), netlink(),
      kea_template(Template::from_file(
          (std::filesystem::path(optval.template_dir) / KEA_TEMPLATE_NAME)
              .string())),
      radvd_template(Template::from_file(
          (std::filesystem::path(optval.template_dir) / RADVD_TEMPLATE_NAME)
              .string())),
      kea_config_path(
          (std::filesystem::path(optval.run_dir) / KEA_CONFIG_NAME).string()),
      radvd_config_path(
          (std::filesystem::path(optval.run_dir) / RADVD_CONFIG_NAME).string()),
      kea_path(optval.kea_path), radvd_path(optval.radvd_path), kea(),
      radvd(), timer(TICK_INTERVAL, *this), epoll_timer(timer, EPOLLIN),
      next_update(Clock::now() + UPDATE_INTERVAL), pending_reload(),
      force_render(false) {}

void Daemon::daemonize(const DAEMON_TYPE type) {
  if (type == DAEMON_TYPE::SYSV) {
    vpsnetd::LOG_INFO("Running as SysV daemon");
    // 1. close all file descriptors besides std{in, out, err}
    struct rlimit res_lim;
    if (getrlimit(RLIMIT_NOFILE, &res_lim) != 0) {
      throw std::runtime_error(string_format(
          "Failed to get file descriptor limit: %s", strerror(errno)));
    }
    if (
#ifdef __MUSL__
        syscall(SYS_close_range, 3, res_lim.rlim_cur, CLOSE_RANGE_CLOEXEC)
#else
        close_range(3, res_lim.rlim_cur, CLOSE_RANGE_CLOEXEC)
#endif
        != 0) {
      throw std::runtime_error(string_format(
          "Failed to close file descriptors: %s", strerror(errno)));
    }
    // 2. reset all signal handlers
    struct sigaction default_handler {};
    default_handler.sa_handler = SIG_DFL;
    for (int i = 1; i < _NSIG; i++) {
      sigaction(i, &default_handler, nullptr);
    }
    // 3. reset sig mask
    sigset_t set;
    sigemptyset(&set);
    if (sigprocmask(SIG_SETMASK, &set, nullptr) < 0) {
      throw std::runtime_error(
          string_format("sigprocmask failed! Error %s", strerror(errno)));
    }
    // 4. reset env variables (none set)
    // 5. do the forking
    int pipefd[2];
    if (pipe(pipefd) != 0) {
      throw std::runtime_error(
          string_format("Failed to create pipe! Error: %s", strerror(errno)));
    }
    pid_t child = fork();
    if (child < 0) {
      throw std::runtime_error(
          string_format("Failed to fork! Error: %s", strerror(errno)));
    } else if (child == 0) {
      close(pipefd[0]);
      uint8_t pipe_msgbuf[1] = {0};
      // 6. start a new session to detach from terminals
      setsid();
      // 7. fork some more to prevent terminal re-attachment by accident
      child = fork();
      if (child < 0) {
        if (write(pipefd[1], pipe_msgbuf, 1) < 0) {
          LOG_ERROR("Failed to report to the parent process");
        }
        throw std::runtime_error(
            string_format("Failed to fork! Error: %s", strerror(errno)));
      } else if (child != 0) {
        // 8. finish first child process
        std::exit(EXIT_SUCCESS);
      }
      //  9. connect std{in, out, err} to /dev/null
      if (std::freopen("/dev/null", "r", stdin) == nullptr ||
          std::freopen("/dev/null", "w", stdout) == nullptr ||
          std::freopen("/dev/null", "w", stderr) == nullptr) {
        LOG_WARN("Failed to redirect standard streams to /dev/null");
      }
      // 10. set umask to 0
      umask(0);
      // 11. cd to root to avoid accidental unmount blocking
      std::filesystem::current_path("/");
      // 12. write PID to file
      std::ofstream pid_file(PID_FILE_PATH, std::ios::trunc);
      pid_file << getpid() << std::endl;
      pid_file.close();
      // 13. make sure we may change links, addresses and routes
      const cap_t caps = cap_get_proc();
      cap_flag_value_t flag_value = CAP_CLEAR;
      const cap_value_t cap_array[] = {CAP_NET_ADMIN};
      if (cap_get_flag(caps, cap_array[0], CAP_EFFECTIVE, &flag_value) < 0) {
        LOG_WARN("Failed to get info about capability CAP_NET_ADMIN");
      }
      if (flag_value != CAP_SET) {
        cap_set_flag(caps, CAP_EFFECTIVE, 1, cap_array, CAP_SET);
        if (cap_set_proc(caps) < 0) {
          cap_free(caps);
          if (write(pipefd[1], pipe_msgbuf, 1) < 0) {
            LOG_ERROR("Failed to report to the parent process");
          }
          throw std::runtime_error("Failed to get CAP_NET_ADMIN!");
        }
      }
      cap_free(caps);
      // privileges are kept: kea and radvd are started by us and need them
      // tell the parent that everything is OK
      pipe_msgbuf[0] = 1;
      if (write(pipefd[1], pipe_msgbuf, 1) < 0) {
        LOG_ERROR("Failed to report to the parent process");
      }
      close(pipefd[1]);
    } else {
      close(pipefd[1]);
      uint8_t pipe_recvbuf[1] = {0};
      if (read(pipefd[0], pipe_recvbuf, 1) == 1 && pipe_recvbuf[0] == 1) {
        std::exit(EXIT_SUCCESS);
      } else {
        LOG_ERROR("Error in child process!");
        std::exit(EXIT_FAILURE);
      }
    }
  }
#ifdef HAVE_SYSTEMD
  else {
    vpsnetd::LOG_INFO("Running as SystemD daemon");
    sd_notify(0, "STATUS=Starting");
  }
#endif
}

void Daemon::initial_update() { update(true); }

void Daemon::start_children() {
  radvd = std::make_unique<ChildProcess>(
      "radvd", std::vector<std::string>{radvd_path, "--nodaemon",
                                        "--logmethod=stderr", "-C",
                                        radvd_config_path});
  kea = std::make_unique<ChildProcess>(
      "kea", std::vector<std::string>{kea_path, "-c", kea_config_path},
      std::vector<std::string>{"KEA_PIDFILE_DIR=" + KEA_PIDFILE_DIR});
}

void Daemon::main_loop() {
  start_children();
#ifdef HAVE_SYSTEMD
  sd_notify(0, "STATUS=Ready\nREADY=1");
#endif
  epoll_timer.poll_loop();
}

void Daemon::shutdown() {
#ifdef HAVE_SYSTEMD
  sd_notify(0, "STOPPING=1");
#endif
  if (radvd) {
    radvd->stop();
  }
  if (kea) {
    kea->stop();
  }
}

bool Daemon::update(bool render) {
  NetworkState state = get_state(netlink, network.rt_proto);
  uint32_t parent_index = interface_name_to_index(network.interface);
  Diff diff = make_diff(state, parent_index, network.rt_proto, network.vps);

  if (!diff.changes.empty()) {
    LOG_INFO(string_format("Updating interfaces (%zu changes)",
                           diff.changes.size()));
    apply_diff(netlink, diff.changes);
  }
  if (!write_configs(diff, render,
                     {{radvd_template, radvd_config_path},
                      {kea_template, kea_config_path}})) {
    LOG_TRACE("Interfaces are up to date");
    return false;
  }
  return true;
}

void Daemon::handle_tick() {
  const Clock::time_point now = Clock::now();
  if (radvd) {
    radvd->supervise(now);
  }
  if (kea) {
    kea->supervise(now);
  }

  if (pending_reload.has_value() && now >= *pending_reload) {
    pending_reload.reset();
    if (radvd) {
      radvd->reload();
    }
    if (kea) {
      kea->reload();
    }
  }

  if (now < next_update) {
    return;
  }
  next_update = now + UPDATE_INTERVAL;
  try {
    if (update(force_render)) {
      pending_reload = now + RELOAD_DELAY;
    }
    force_render = false;
  } catch (std::runtime_error &ex) {
    LOG_ERROR(std::string("Failed to run update: ").append(ex.what()));
  } catch (std::invalid_argument &ex) {
    LOG_ERROR(std::string("Failed to run update: ").append(ex.what()));
  }
}

void Daemon::handle_hangup() {
#ifdef HAVE_SYSTEMD
  sd_notify(0, "RELOADING=1");
#endif
  try {
    NetworkConfiguration new_network = parse_configuration(confpath);
    Template new_kea_template = Template::from_file(
        (std::filesystem::path(template_dir) / KEA_TEMPLATE_NAME).string());
    Template new_radvd_template = Template::from_file(
        (std::filesystem::path(template_dir) / RADVD_TEMPLATE_NAME).string());
    network = std::move(new_network);
    kea_template = std::move(new_kea_template);
    radvd_template = std::move(new_radvd_template);
    next_update = Clock::now();
    force_render = true;
    LOG_INFO("Config reloaded");
  } catch (libconfig::ParseException &pex) {
    LOG_ERROR(string_format("Failed to parse config file %s at line %d: %s",
                            pex.getFile(), pex.getLine(), pex.getError()));
  } catch (libconfig::FileIOException &fex) {
    LOG_ERROR(string_format("Failed to open config file %s", confpath.c_str()));
  } catch (std::invalid_argument &ex) {
    LOG_ERROR(std::string("Invalid config file: ").append(ex.what()));
  } catch (TemplateError &ex) {
    LOG_ERROR(std::string("Invalid template: ").append(ex.what()));
  }
#ifdef HAVE_SYSTEMD
  sd_notify(0, "READY=1");
#endif
}
} // namespace vpsnetd
