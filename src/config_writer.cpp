#include "config_writer.hpp"

#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "log/logger.hpp"
#include "string-format.hpp"
#include "template_context.hpp"

namespace vpsnetd {
namespace {
void sync_file(const std::string &path) {
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) {
    throw std::runtime_error(string_format("Unable to open %s: %s",
                                           path.c_str(), strerror(errno)));
  }
  if (fsync(fd) == -1) {
    const int error = errno;
    close(fd);
    throw std::runtime_error(
        string_format("Failed to sync %s: %s", path.c_str(), strerror(error)));
  }
  close(fd);
}

void write_temporary(const std::string &path, const std::string &contents) {
  std::ofstream config_file(path, std::ios::trunc);
  if (!config_file.is_open()) {
    throw std::runtime_error(string_format("Unable to open %s: %s",
                                           path.c_str(), strerror(errno)));
  }
  config_file << contents;
  config_file.flush();
  if (!config_file.good()) {
    throw std::runtime_error(string_format("Failed to write %s", path.c_str()));
  }
  config_file.close();
  sync_file(path);
}
} // namespace

void write_config(const Template &config_template,
                  const std::vector<InterfaceState> &interfaces,
                  const std::string &path) {
  const std::string contents =
      config_template.render(make_template_context(interfaces));
  write_file_atomically(path, contents);
  LOG_DEBUG(string_format("Wrote %s from %s (%zu interfaces)", path.c_str(),
                          config_template.name().c_str(), interfaces.size()));
}

bool write_configs(const Diff &diff, bool force_render,
                   const std::vector<ConfigOutput> &outputs) {
  if (diff.changes.empty() && !force_render) {
    return false;
  }
  for (const ConfigOutput &output : outputs) {
    write_config(output.config_template, diff.interfaces, output.path);
  }
  return true;
}

void write_file_atomically(const std::string &path,
                           const std::string &contents) {
  const std::string temporary_path = path + ".tmp";
  try {
    write_temporary(temporary_path, contents);
    std::filesystem::rename(temporary_path, path);
  } catch (std::runtime_error &ex) {
    std::error_code ignored;
    if (std::filesystem::remove(temporary_path, ignored)) {
      LOG_DEBUG(string_format("Removed %s", temporary_path.c_str()));
    }
    throw;
  }
}
} // namespace vpsnetd
