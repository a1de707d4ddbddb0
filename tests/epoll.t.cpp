#include "epoll.hpp"

#include <boost/test/unit_test.hpp>

#include <unistd.h>

#include <csignal>
#include <stdexcept>

#include "daemon.hpp"

namespace vpsnetd {
namespace tests {

namespace {
class PipeSubject {
private:
  int fds[2];

public:
  int epollin_count = 0;
  int hangup_count = 0;

  PipeSubject() {
    if (pipe(fds) != 0) {
      throw std::runtime_error("Failed to create pipe");
    }
  }
  ~PipeSubject() {
    close(fds[0]);
    close(fds[1]);
  }

  operator int() { return fds[0]; }

  void notify() {
    char byte = 1;
    BOOST_REQUIRE_EQUAL(write(fds[1], &byte, 1), 1);
  }

  void handle_epollin() {
    char byte;
    BOOST_REQUIRE_EQUAL(read(fds[0], &byte, 1), 1);
    epollin_count++;
    sighandler(SIGTERM);
  }

  void handle_hangup() { hangup_count++; }
};

class SignalStateFixture {
protected:
  SignalStateFixture() { reset(); }
  ~SignalStateFixture() { reset(); }

  void reset() {
    last_signal = 0;
    stop_requested = 0;
  }
};
} // namespace

BOOST_FIXTURE_TEST_SUITE(TestEpoll, SignalStateFixture)

BOOST_AUTO_TEST_CASE(HangupThenEvent)
{
  PipeSubject subject;
  Epoll<PipeSubject> epoll(subject, EPOLLIN);
  sighandler(SIGHUP);
  subject.notify();

  epoll.poll_loop();
  BOOST_CHECK_EQUAL(subject.hangup_count, 1);
  BOOST_CHECK_EQUAL(subject.epollin_count, 1);
}

BOOST_AUTO_TEST_CASE(HangupDoesNotCancelStop)
{
  PipeSubject subject;
  Epoll<PipeSubject> epoll(subject, EPOLLIN);
  sighandler(SIGTERM);
  sighandler(SIGHUP);

  epoll.poll_loop();
  BOOST_CHECK_EQUAL(subject.epollin_count, 0);
  BOOST_CHECK_EQUAL(subject.hangup_count, 0);
}

BOOST_AUTO_TEST_CASE(Interrupt)
{
  PipeSubject subject;
  Epoll<PipeSubject> epoll(subject, EPOLLIN);
  sighandler(SIGINT);

  epoll.poll_loop();
  BOOST_CHECK_EQUAL(subject.epollin_count, 0);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace tests
} // namespace vpsnetd
