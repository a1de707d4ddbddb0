#include "child_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

#include "log/logger.hpp"
#include "string-format.hpp"

namespace vpsnetd {
ChildProcess::ChildProcess(const std::string &name,
                           const std::vector<std::string> &arguments,
                           const std::vector<std::string> &environment,
                           Clock::time_point first_start)
    : _name(name), _arguments(arguments), _environment(environment), _pid(0),
      _next_start(first_start) {
  if (_arguments.empty()) {
    throw std::invalid_argument("A child process needs a program to run!");
  }
}

ChildProcess::~ChildProcess() noexcept { stop(); }

void ChildProcess::spawn(Clock::time_point now) {
  LOG_INFO(string_format("Starting %s", _name.c_str()));
  _next_start = now + CHILD_RESTART_DELAY;

  // the child reports a failed exec through this pipe, a successful exec
  // closes it
  int pipefd[2];
  if (pipe2(pipefd, O_CLOEXEC) != 0) {
    LOG_ERROR(string_format("Failed to start %s: pipe failed: %s",
                            _name.c_str(), strerror(errno)));
    return;
  }

  std::vector<char *> argv;
  for (std::string &argument : _arguments) {
    argv.push_back(argument.data());
  }
  argv.push_back(nullptr);

  pid_t child = fork();
  if (child < 0) {
    LOG_ERROR(string_format("Failed to start %s: fork failed: %s",
                            _name.c_str(), strerror(errno)));
    close(pipefd[0]);
    close(pipefd[1]);
    return;
  }

  if (child == 0) {
    close(pipefd[0]);
    sigset_t set;
    sigemptyset(&set);
    sigprocmask(SIG_SETMASK, &set, nullptr);
    for (std::string &variable : _environment) {
      putenv(variable.data());
    }
    execv(argv[0], argv.data());
    int exec_error = errno;
    if (write(pipefd[1], &exec_error, sizeof(exec_error)) < 0) {
      _exit(126);
    }
    _exit(127);
  }

  close(pipefd[1]);
  int exec_error = 0;
  ssize_t received;
  do {
    received = read(pipefd[0], &exec_error, sizeof(exec_error));
  } while (received < 0 && errno == EINTR);
  close(pipefd[0]);

  if (received > 0) {
    LOG_ERROR(string_format("Failed to start %s: %s", _name.c_str(),
                            strerror(exec_error)));
    pid_t reaped;
    do {
      reaped = waitpid(child, nullptr, 0);
    } while (reaped < 0 && errno == EINTR);
    return;
  }

  _pid = child;
  LOG_DEBUG(string_format("%s running with PID %d", _name.c_str(), _pid));
}

void ChildProcess::supervise(Clock::time_point now) {
  reap(now);
  if (_pid == 0 && now >= _next_start) {
    spawn(now);
  }
}

bool ChildProcess::reap(Clock::time_point now) {
  if (_pid == 0) {
    return false;
  }

  int status = 0;
  pid_t result = waitpid(_pid, &status, WNOHANG);
  if (result == 0) {
    return false;
  }
  if (result < 0) {
    LOG_ERROR(string_format("%s failed: %s", _name.c_str(), strerror(errno)));
  } else if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    LOG_WARN(string_format("%s exited with code: %d", _name.c_str(),
                           WEXITSTATUS(status)));
  } else if (WIFSIGNALED(status)) {
    LOG_WARN(string_format("%s was killed by signal %d", _name.c_str(),
                           WTERMSIG(status)));
  } else {
    LOG_INFO(string_format("%s exited", _name.c_str()));
  }

  _pid = 0;
  _next_start = now + CHILD_RESTART_DELAY;
  return true;
}

void ChildProcess::reload() {
  if (_pid == 0) {
    LOG_DEBUG(string_format("%s is not running, nothing to reload",
                            _name.c_str()));
    return;
  }
  if (kill(_pid, SIGHUP) != 0) {
    LOG_WARN(string_format("Failed to reload %s: %s", _name.c_str(),
                           strerror(errno)));
    return;
  }
  LOG_INFO(string_format("Reloading %s", _name.c_str()));
}

void ChildProcess::stop() {
  if (_pid == 0) {
    return;
  }
  LOG_INFO(string_format("Stopping %s", _name.c_str()));
  if (kill(_pid, SIGTERM) != 0) {
    LOG_WARN(string_format("Failed to stop %s: %s", _name.c_str(),
                           strerror(errno)));
  }
  pid_t result;
  do {
    result = waitpid(_pid, nullptr, 0);
  } while (result < 0 && errno == EINTR);
  _pid = 0;
}
} // namespace vpsnetd
