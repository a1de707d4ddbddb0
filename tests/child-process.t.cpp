#include "child_process.hpp"

#include <boost/test/unit_test.hpp>

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace vpsnetd {
namespace tests {

namespace {
// Polls until the child has been reaped, gives up after five seconds.
bool wait_for_exit(ChildProcess &child) {
  for (int i = 0; i < 100; i++) {
    if (child.reap(Clock::now())) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return false;
}
} // namespace

BOOST_AUTO_TEST_SUITE(TestChildProcess)

BOOST_AUTO_TEST_CASE(NeedsProgram)
{
  BOOST_CHECK_THROW(ChildProcess("nothing", {}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(StartDelay)
{
  Clock::time_point now = Clock::now();
  ChildProcess child("true", {"/bin/true"}, {}, now + std::chrono::hours(1));
  child.supervise(now);
  BOOST_CHECK(!child.running());

  // constructed children wait for the restart delay by default
  ChildProcess delayed("true", {"/bin/true"});
  delayed.supervise(Clock::now());
  BOOST_CHECK(!delayed.running());
  delayed.supervise(Clock::now() + CHILD_RESTART_DELAY);
  BOOST_CHECK(delayed.running());
  BOOST_CHECK(wait_for_exit(delayed));
}

BOOST_AUTO_TEST_CASE(RestartAfterExit)
{
  ChildProcess child("true", {"/bin/true"}, {}, Clock::now());
  child.supervise(Clock::now());
  BOOST_REQUIRE(child.running());
  BOOST_CHECK_GT(child.pid(), 0);

  BOOST_REQUIRE(wait_for_exit(child));
  BOOST_CHECK(!child.running());
  BOOST_CHECK(!child.reap(Clock::now()));

  Clock::time_point exited = Clock::now();
  child.supervise(exited);
  BOOST_CHECK(!child.running());
  child.supervise(exited + CHILD_RESTART_DELAY + std::chrono::seconds(1));
  BOOST_CHECK(child.running());
  BOOST_CHECK(wait_for_exit(child));
}

BOOST_AUTO_TEST_CASE(MissingProgram)
{
  ChildProcess child("missing", {"/nonexistent/vpsnetd/program"}, {},
                     Clock::now());
  child.supervise(Clock::now());
  BOOST_CHECK(!child.running());
}

BOOST_AUTO_TEST_CASE(Environment)
{
  std::filesystem::path output =
      std::filesystem::temp_directory_path() /
      ("vpsnetd-child-" + std::to_string(getpid()));
  ChildProcess child(
      "sh",
      {"/bin/sh", "-c", "printf %s \"$VPSNETD_TEST\" > " + output.string()},
      {"VPSNETD_TEST=pidfile-dir"}, Clock::now());
  child.supervise(Clock::now());
  BOOST_REQUIRE(child.running());
  BOOST_REQUIRE(wait_for_exit(child));

  std::ifstream file(output);
  std::string contents;
  std::getline(file, contents);
  std::filesystem::remove(output);
  BOOST_CHECK_EQUAL(contents, "pidfile-dir");
}

BOOST_AUTO_TEST_CASE(Reload)
{
  ChildProcess child("sleep", {"/bin/sleep", "30"}, {}, Clock::now());
  child.reload(); // not running yet
  child.supervise(Clock::now());
  BOOST_REQUIRE(child.running());

  // sleep does not handle SIGHUP and exits
  child.reload();
  BOOST_CHECK(wait_for_exit(child));
}

BOOST_AUTO_TEST_CASE(Stop)
{
  ChildProcess child("sleep", {"/bin/sleep", "30"}, {}, Clock::now());
  child.supervise(Clock::now());
  BOOST_REQUIRE(child.running());
  child.stop();
  BOOST_CHECK(!child.running());
  child.stop();
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace tests
} // namespace vpsnetd
