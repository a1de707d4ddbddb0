#pragma once

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <stdexcept>
#include <sys/epoll.h>
#include <unistd.h>

namespace vpsnetd {
// defined in daemon.cpp
extern volatile std::sig_atomic_t last_signal;
// latched by SIGINT and SIGTERM so a later SIGHUP cannot undo it
extern volatile std::sig_atomic_t stop_requested;

// Waits for the subject's file descriptor to become readable and hands the
// event over to it. Signals interrupt the wait: SIGINT and SIGTERM end the
// loop, SIGHUP is passed on to the subject.
template <class T> class Epoll {
  static constexpr size_t MAX_EVENTS = 1;

  T &subject;
  int epoll_fd;
  struct epoll_event epoll_ctl_cfg;
  std::array<struct epoll_event, MAX_EVENTS> events;

public:
  Epoll(T &subject, uint32_t events)
      : subject(subject), epoll_ctl_cfg{.events = events, .data = {}},
        events() {
    epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd == -1) {
      throw std::runtime_error("Failed to create epoll structure!");
    }
    epoll_ctl_cfg.data.fd = subject;

    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, subject, &epoll_ctl_cfg) == -1) {
      close(epoll_fd);
      throw std::runtime_error("Failed at epoll_ctl!");
    }
  }

  ~Epoll() noexcept { close(epoll_fd); }

  // forbid copy construction and assignment as exactly one epoll instance
  // should be wrapping a given subject at any time
  Epoll(const Epoll<T> &other) = delete;
  Epoll<T> &operator=(const Epoll<T> &other) = delete;

  void poll_loop() {
    while (true) {
      if (vpsnetd::stop_requested) {
        return;
      }
      if (vpsnetd::last_signal == SIGHUP) {
        vpsnetd::last_signal = 0;
        subject.handle_hangup();
      }

      if (epoll_wait(epoll_fd, events.data(), MAX_EVENTS, -1) == -1) {
        if (errno == EINTR) {
          continue;
        }
        throw std::runtime_error("epoll_wait failed");
      }
      if ((events[0].events & EPOLLIN) > 0) {
        subject.handle_epollin();
      }
    }
  }
};
} // namespace vpsnetd
