#define BOOST_TEST_MODULE vpsnetd
#include <boost/test/unit_test.hpp>

#include <memory>

#include "log/logger.hpp"
#include "log/stdout_logsink.hpp"

namespace vpsnetd {
namespace tests {

// Routes the daemon's own log output to stdout so failing tests show it.
class LoggerFixture {
public:
  LoggerFixture() {
    global_logger.reset(new Logger(std::make_unique<StdoutLogSink>()));
    current_global_log_level = Level::WARN;
  }

  ~LoggerFixture() { global_logger.reset(); }
};

BOOST_TEST_GLOBAL_FIXTURE(LoggerFixture);

} // namespace tests
} // namespace vpsnetd
