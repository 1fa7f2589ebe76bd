#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>

#include "offpack/config.hpp"
#include "log.hpp"
#include "util.hpp"

namespace offpack {

namespace {

struct Flag {
  const char* name;     // --name
  const char* key;      // option name
  const char* fixed;    // value for flags without argument
};

const Flag FLAGS[] = {
  {"syslog",       "UseSyslog",       "1"},
  {"nosyslog",     "UseSyslog",       "0"},
  {"facility",     "SyslogFacility",  nullptr},
  {"backupdir",    "BackupDirectory", nullptr},
  {"workdir",      "WorkDirectory",   nullptr},
  {"config",       "ConfigFile",      nullptr},
  {"dryrun",       "DryRun",          "1"},
  {"blocksize",    "BlockSize",       nullptr},
  {"maxfilesize",  "MaxFileSize",     nullptr},
  {"maximagesize", "MaxImageSize",    nullptr},
  {"pwfile",       "PasswordFile",    nullptr},
  {"cipher",       "Cipher",          nullptr},
};

const char* MANDATORY[] = {"BackupDirectory", "WorkDirectory", "PasswordFile"};

std::string trim(const std::string& s){
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

int parse_bool(const std::string& v, bool& out){
  if (v == "1" || v == "yes" || v == "true" || v == "on")  { out = true;  return 0; }
  if (v == "0" || v == "no" || v == "false" || v == "off") { out = false; return 0; }
  return -EINVAL;
}

std::string path_opt(const std::string& v){
  return util::rstrip_slash(util::expand_args(v));
}

} // namespace

int parse_args(int argc, char* argv[], OptionMap& cmdline, Help& help, std::string& err){
  help = Help::none;
  int i = 1;
  while (i < argc) {
    const char* a = argv[i];
    if (a[0] != '-') { err = std::string("unexpected argument '") + a + "'"; return -EINVAL; }
    a += (a[1] == '-') ? 2 : 1;

    std::string name = a, value;
    bool inline_value = false;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name.resize(eq);
      inline_value = true;
    }

    if (name == "help" || name == "man") {
      if (inline_value) { err = "option '" + name + "' takes no value"; return -EINVAL; }
      if (name == "man") help = Help::manual;
      else if (help == Help::none) help = Help::usage;
      ++i;
      continue;
    }

    const Flag* f = nullptr;
    for (const auto& cand : FLAGS) {
      if (name == cand.name) { f = &cand; break; }
    }
    if (!f) { err = "unknown option '" + std::string(argv[i]) + "'"; return -EINVAL; }

    if (f->fixed) {
      if (inline_value) { err = "option --" + name + " takes no value"; return -EINVAL; }
      cmdline[f->key] = f->fixed;
      ++i;
    } else if (inline_value) {
      cmdline[f->key] = value;
      ++i;
    } else if (i + 1 < argc) {
      cmdline[f->key] = argv[i + 1];
      i += 2;
    } else {
      err = "option --" + name + " requires a value";
      return -EINVAL;
    }
  }
  return 0;
}

int read_config_file(const std::string& path, OptionMap& out){
  std::ifstream in(path);
  if (!in) return errno ? -errno : -ENOENT;

  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    lineno++;
    std::string t = trim(line);
    if (t.empty() || t[0] == '#') continue;

    size_t eq = t.find('=');
    std::string key = (eq == std::string::npos) ? std::string() : trim(t.substr(0, eq));
    std::string value = (eq == std::string::npos) ? std::string() : trim(t.substr(eq + 1));
    if (key.empty() || value.empty() || key.find_first_of(" \t") != std::string::npos) {
      util::log_msg(LOG_WARNING, "%s:%d: ignoring malformed line", path.c_str(), lineno);
      continue;
    }
    out[key] = value;
  }
  if (in.bad()) return -EIO;
  return 0;
}

int build_config(const OptionMap& file, const OptionMap& cmdline, Config& cfg, std::string& err){
  // everything specified on command line overrides config file
  OptionMap opt = file;
  for (const auto& kv : cmdline) opt[kv.first] = kv.second;

  for (const char* key : MANDATORY) {
    if (opt.find(key) == opt.end()) {
      err = std::string("mandatory option <") + key + "> not defined";
      return -EINVAL;
    }
  }

  cfg.backup_dir = path_opt(opt["BackupDirectory"]);
  cfg.work_dir = path_opt(opt["WorkDirectory"]);
  cfg.pass_file = util::expand_args(opt["PasswordFile"]);

  struct { const char* key; uint64_t* dst; } sizes[] = {
    {"BlockSize",    &cfg.limits.block_size},
    {"MaxFileSize",  &cfg.limits.max_file_size},
    {"MaxImageSize", &cfg.limits.volume_capacity},
  };
  for (auto& s : sizes) {
    auto it = opt.find(s.key);
    if (it == opt.end()) continue;
    if (util::parse_u64(it->second, *s.dst) != 0) {
      err = std::string("bad value for ") + s.key + ": '" + it->second + "'";
      return -EINVAL;
    }
  }

  struct { const char* key; bool* dst; } flags[] = {
    {"UseSyslog", &cfg.use_syslog},
    {"DryRun",    &cfg.dry_run},
  };
  for (auto& f : flags) {
    auto it = opt.find(f.key);
    if (it == opt.end()) continue;
    if (parse_bool(it->second, *f.dst) != 0) {
      err = std::string("bad value for ") + f.key + ": '" + it->second + "'";
      return -EINVAL;
    }
  }

  if (opt.count("SyslogFacility")) cfg.facility = opt["SyslogFacility"];
  int fac = 0;
  if (util::parse_facility(cfg.facility, fac) != 0) {
    err = "unknown syslog facility '" + cfg.facility + "'";
    return -EINVAL;
  }

  if (opt.count("Cipher")) cfg.cipher = opt["Cipher"];
  if (cfg.cipher != "gpg" && cfg.cipher != "aes") {
    err = "unknown cipher '" + cfg.cipher + "' (gpg or aes)";
    return -EINVAL;
  }

  if (pack::validate_limits(cfg.limits) != 0) {
    err = "BlockSize must be non-zero and no larger than MaxFileSize and MaxImageSize";
    return -EINVAL;
  }
  return 0;
}

void print_usage(FILE* out, const char* prog){
  std::fprintf(out,
    "Usage: %s [options]\n"
    "\n"
    " Options:\n"
    "   --config <f>\t\tread configuration from <f> (default %s)\n"
    "   --syslog, --nosyslog\tlog to syslog or to stdout\n"
    "   --facility <f>\tlog to syslog facility <f>\n"
    "   --backupdir <d>\tfind backups in directory <d>\n"
    "   --workdir <d>\tcreate volume directories in <d>\n"
    "   --blocksize <b>\twrite in multiples of <b> bytes\n"
    "   --maxfilesize <b>\tsplit files larger than <b> bytes\n"
    "   --maximagesize <b>\tdon't put more than <b> bytes into one volume\n"
    "   --pwfile <f>\t\tencrypt with passphrase from file <f>\n"
    "   --cipher <c>\t\tgpg (default) or aes\n"
    "   --dryrun\t\tdon't create any files\n"
    "   --help\t\tprint this summary\n"
    "   --man\t\tprint the full manual\n",
    prog, DEFAULT_CONFIG_FILE);
}

void print_manual(FILE* out, const char* prog){
  std::fprintf(out,
    "%s - split and encrypt backup archives for offsite media\n"
    "\n"
    "Selects the newest level 0 archive of every filesystem in the backup\n"
    "directory, and a newer level 1 archive when there is one. Each archive is\n"
    "cut into parts no larger than MaxFileSize and no volume directory holds\n"
    "more than MaxImageSize bytes. Parts are encrypted into\n"
    "<WorkDirectory>/<volume>/<archive>[.NNofMM].gpg (or .aes).\n"
    "\n",
    prog);
  print_usage(out, prog);
  std::fprintf(out,
    "\n"
    " Option details:\n"
    "   --config <f>       configuration file, default %s\n"
    "   --syslog           log through syslog(3) instead of stdout (UseSyslog)\n"
    "   --facility <f>     syslog facility, default user (SyslogFacility)\n"
    "   --backupdir <d>    directory holding <fs>.<level>.<time>.tar.bz2 archives,\n"
    "                      mandatory (BackupDirectory)\n"
    "   --workdir <d>      output root, created if missing, mandatory (WorkDirectory)\n"
    "   --blocksize <b>    split points are multiples of <b>, default 4096 (BlockSize)\n"
    "   --maxfilesize <b>  largest part, default 2000000000 (MaxFileSize)\n"
    "   --maximagesize <b> bytes per volume, default 4698112000 (MaxImageSize)\n"
    "   --pwfile <f>       first line of <f> is the passphrase, mandatory (PasswordFile)\n"
    "   --cipher <c>       gpg runs gpg --symmetric, aes writes AES-256-GCM (Cipher)\n"
    "   --dryrun           show the plan, create nothing (DryRun)\n"
    "\n"
    " Configuration file:\n"
    "   One option=value per line, using the names in parentheses above.\n"
    "   Whitespace around '=' is ignored, blank lines and lines starting with\n"
    "   '#' are skipped. Command line options take priority.\n"
    "\n"
    " Exit status:\n"
    "   0 when every part was written, 1 otherwise.\n",
    DEFAULT_CONFIG_FILE);
}

}
