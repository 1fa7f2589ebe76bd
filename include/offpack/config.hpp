#pragma once
#include <cstdio>
#include <map>
#include <string>

#include "pack/predict.hpp"

namespace offpack {

inline constexpr const char* DEFAULT_CONFIG_FILE = "/etc/backup/backup.conf";

struct Config {
  std::string backup_dir;
  std::string work_dir;
  std::string pass_file;
  std::string cipher = "gpg";
  bool use_syslog = false;
  std::string facility = "user";
  bool dry_run = false;
  pack::Limits limits{4698112000ULL, 2000000000ULL, 4096};
};

// Option name (as in the config file) -> value
using OptionMap = std::map<std::string, std::string>;

enum class Help { none, usage, manual };   // --help, --man

// Collects command line options. 0 or -EINVAL with a message in err.
int parse_args(int argc, char* argv[], OptionMap& cmdline, Help& help, std::string& err);

// name=value lines; blank lines and '#' comments skipped. 0 or -errno.
int read_config_file(const std::string& path, OptionMap& out);

// Applies defaults < file < command line and validates the result.
// 0 or -EINVAL with a message in err.
int build_config(const OptionMap& file, const OptionMap& cmdline, Config& cfg, std::string& err);

void print_usage(FILE* out, const char* prog);
// Usage plus the description of every option and of the config file
void print_manual(FILE* out, const char* prog);

}
