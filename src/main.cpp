#include <getopt.h>
#include <libconfig.h++>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include "configuration.hpp"
#include "daemon.hpp"
#include "log/logger.hpp"
#include "log/stdout_logsink.hpp"
#include "log/syslog_logsink.hpp"
#include "network_state.hpp"
#include "string-format.hpp"
#include "template.hpp"
#include "version.hpp"

#ifdef HAVE_SYSTEMD
#include "log/systemd_logsink.hpp"
#endif

#ifndef PROGRAM_VERSION
#define PROGRAM_VERSION "debug"
#endif

const char CONFIG_FILE_TAG = 'c';
const char TEMPLATES_TAG = 't';
const char RUN_DIR_TAG = 'r';
const char RADVD_TAG = 'R';
const char KEA_TAG = 'K';
const char ONESHOT_TAG = '1';
const char FOREGROUND_TAG = 'f';
const char VERBOSE_TAG = 'v';
#ifdef HAVE_SYSTEMD
const char SYSTEMD_DAEMON_TAG = 'n';
#endif
const char SYSV_DAEMON_TAG = 'o';

const struct option long_options[] = {
    {"configfile", required_argument, nullptr, CONFIG_FILE_TAG},
    {"templates", required_argument, nullptr, TEMPLATES_TAG},
    {"rundir", required_argument, nullptr, RUN_DIR_TAG},
    {"radvd", required_argument, nullptr, RADVD_TAG},
    {"kea", required_argument, nullptr, KEA_TAG},
    {"oneshot", no_argument, nullptr, ONESHOT_TAG},
    {"foreground", no_argument, nullptr, FOREGROUND_TAG},
    {"debug", no_argument, nullptr, VERBOSE_TAG},
#ifdef HAVE_SYSTEMD
    {"systemd", no_argument, nullptr, SYSTEMD_DAEMON_TAG},
#endif
    {"sysv", no_argument, nullptr, SYSV_DAEMON_TAG},
    {nullptr, 0, nullptr, 0}};

int main(int argc, char *const argv[]) {
  vpsnetd::ProgramConfiguration optval = {
      .confpath = "/etc/vpsnetd/vpsnetd.conf",
      .template_dir = "/etc/vpsnetd/templates",
      .run_dir = "/run/vpsnetd",
      .radvd_path = "/usr/sbin/radvd",
      .kea_path = "/usr/sbin/kea-dhcp4",
      .foreground = false,
      .oneshot = false,
#ifdef HAVE_SYSTEMD
      .daemon_type = vpsnetd::DAEMON_TYPE::SYSTEMD,
#else
      .daemon_type = vpsnetd::DAEMON_TYPE::SYSV,
#endif
      .network = {}};

  int opt;
  while ((opt = getopt_long(argc, argv, "c:t:r:1fv", long_options, nullptr)) !=
         -1) {
    switch (opt) {
    case CONFIG_FILE_TAG:
      optval.confpath = optarg;
      break;

    case TEMPLATES_TAG:
      optval.template_dir = optarg;
      break;

    case RUN_DIR_TAG:
      optval.run_dir = optarg;
      break;

    case RADVD_TAG:
      optval.radvd_path = optarg;
      break;

    case KEA_TAG:
      optval.kea_path = optarg;
      break;

    case ONESHOT_TAG:
      optval.oneshot = true;
      optval.foreground = true;
      break;

    case FOREGROUND_TAG:
      optval.foreground = true;
      break;

    case VERBOSE_TAG:
      vpsnetd::current_global_log_level = vpsnetd::Level::DEBUG;
      break;

    case SYSV_DAEMON_TAG:
      optval.daemon_type = vpsnetd::DAEMON_TYPE::SYSV;
      break;

#ifdef HAVE_SYSTEMD
    case SYSTEMD_DAEMON_TAG:
      optval.daemon_type = vpsnetd::DAEMON_TYPE::SYSTEMD;
      break;
#endif

    default:
      std::cerr << "Usage: " << argv[0]
                << " [-c configfile] [-t templatedir] [-r rundir]"
                   " [--radvd path] [--kea path] [-1] [-f] [-v]"
#ifdef HAVE_SYSTEMD
                   " [--systemd|--sysv]"
#else
                   " [--sysv]"
#endif
                << std::endl;
      return EXIT_FAILURE;
    }
  }

  if (optval.foreground) {
    vpsnetd::global_logger.reset(
        new vpsnetd::Logger(std::make_unique<vpsnetd::StdoutLogSink>()));
  } else if (optval.daemon_type == vpsnetd::DAEMON_TYPE::SYSV) {
    vpsnetd::global_logger.reset(
        new vpsnetd::Logger(std::make_unique<vpsnetd::SyslogLogSink>()));
  }
#ifdef HAVE_SYSTEMD
  else {
    vpsnetd::global_logger.reset(new vpsnetd::Logger(
        std::make_unique<vpsnetd::SystemdLogSink>(std::cerr)));
  }
#endif
  vpsnetd::LOG_INFO(
      vpsnetd::string_format("vpsnetd %s starting...", PROGRAM_VERSION));

  try {
    vpsnetd::LOG_INFO(
        std::string("Loading config from file ").append(optval.confpath));
    optval.network = vpsnetd::parse_configuration(optval.confpath);
  } catch (libconfig::ParseException &pex) {
    vpsnetd::LOG_FATAL(vpsnetd::string_format(
        "Failed to parse config file %s at line %d! Error: %s", pex.getFile(),
        pex.getLine(), pex.getError()));
    std::exit(EXIT_FAILURE);
  } catch (libconfig::FileIOException &fex) {
    std::ostringstream os;
    os << "Error reading file " << optval.confpath << ".";
    if (!std::filesystem::exists(optval.confpath)) {
      os << " The file does not exist.";
    }
    vpsnetd::LOG_FATAL(os.str());
    std::exit(EXIT_FAILURE);
  } catch (std::invalid_argument &ex) {
    vpsnetd::LOG_FATAL(std::string("Invalid config file: ").append(ex.what()));
    std::exit(EXIT_FAILURE);
  }

  try {
    std::filesystem::create_directories(optval.run_dir);
    vpsnetd::Daemon daemon(optval);
    vpsnetd::LOG_INFO("Initialization finished");

    if (!optval.foreground) {
      daemon.daemonize(optval.daemon_type);
    } else {
      vpsnetd::LOG_INFO("Running in foreground.");
    }
    std::signal(SIGINT, vpsnetd::sighandler);
    std::signal(SIGTERM, vpsnetd::sighandler);
    std::signal(SIGHUP, vpsnetd::sighandler);

    daemon.initial_update();
    if (optval.oneshot) {
      vpsnetd::LOG_INFO("Configuration written, exiting");
      return 0;
    }
    daemon.main_loop();
    daemon.shutdown();
  } catch (vpsnetd::TemplateError &ex) {
    vpsnetd::LOG_FATAL(std::string("Invalid template: ").append(ex.what()));
    std::exit(EXIT_FAILURE);
  } catch (vpsnetd::InterfaceNotFound &ex) {
    vpsnetd::LOG_FATAL(ex.what());
    std::exit(EXIT_FAILURE);
  } catch (std::filesystem::filesystem_error &ex) {
    vpsnetd::LOG_FATAL(ex.what());
    std::exit(EXIT_FAILURE);
  } catch (std::runtime_error &e) {
    vpsnetd::LOG_FATAL(e.what());
    std::exit(EXIT_FAILURE);
  } catch (std::invalid_argument &e) {
    vpsnetd::LOG_FATAL(std::string("Invalid netlink reply: ").append(e.what()));
    std::exit(EXIT_FAILURE);
  }
  vpsnetd::LOG_INFO("Finished");
  return 0;
}
