#pragma once

#include <string>
#include <vector>

#include "diff.hpp"
#include "template.hpp"

namespace vpsnetd {
struct ConfigOutput {
  const Template &config_template;
  std::string path;
};

// Renders the template over the provisioned interfaces and replaces the file
// at path. Readers see either the old or the new contents, never a mix.
void write_config(const Template &config_template,
                  const std::vector<InterfaceState> &interfaces,
                  const std::string &path);
// Rewrites every output when the pass changed the kernel state or when
// force_render is set, i.e. on the first pass and after a reload. Returns
// whether anything was written.
bool write_configs(const Diff &diff, bool force_render,
                   const std::vector<ConfigOutput> &outputs);
void write_file_atomically(const std::string &path, const std::string &contents);
} // namespace vpsnetd
