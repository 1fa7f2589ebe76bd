#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include "log.hpp"
#include "offpack/config.hpp"
#include "offpack/dispatch.hpp"
#include "pack/driver.hpp"
#include "pack/select.hpp"
#include "util.hpp"

static std::atomic<bool> g_cancel{false};

static void on_signal(int){
  g_cancel.store(true);
}

static int fail(const std::string& msg){
  util::log_msg(LOG_ERR, "%s", msg.c_str());
  util::log_close();
  return 1;
}

int main(int argc, char* argv[]) {
  const char* prog = std::strrchr(argv[0], '/') ? std::strrchr(argv[0], '/') + 1 : argv[0];

  offpack::OptionMap cmdline, file;
  offpack::Help help = offpack::Help::none;
  std::string err;
  if (offpack::parse_args(argc, argv, cmdline, help, err) != 0) {
    std::fprintf(stderr, "%s: %s\n", prog, err.c_str());
    offpack::print_usage(stderr, prog);
    return 1;
  }
  if (help == offpack::Help::manual) {
    offpack::print_manual(stdout, prog);
    return 0;
  }
  if (help == offpack::Help::usage) {
    offpack::print_usage(stdout, prog);
    return 0;
  }

  std::string config_file = offpack::DEFAULT_CONFIG_FILE;
  if (cmdline.count("ConfigFile")) config_file = util::expand_args(cmdline["ConfigFile"]);
  int rc = offpack::read_config_file(config_file, file);
  if (rc != 0) {
    util::log_msg(LOG_ERR, "Can't open config file %s: %s", config_file.c_str(), std::strerror(-rc));
    return 1;
  }

  offpack::Config cfg;
  if (offpack::build_config(file, cmdline, cfg, err) != 0) return fail(err);

  if (cfg.use_syslog) {
    int fac = LOG_USER;
    if (util::parse_facility(cfg.facility, fac) != 0) return fail("unknown syslog facility " + cfg.facility);
    util::log_open_syslog(prog, fac);
  }

  // make sure work directory exists and is writeable
  rc = util::fs::check_work_dir(cfg.work_dir.c_str());
  if (rc != 0) {
    util::log_msg(LOG_ERR, "work directory %s: %s", cfg.work_dir.c_str(), std::strerror(-rc));
    return fail("can't set up work directory " + cfg.work_dir);
  }

  auto cipher = offpack::make_cipher(cfg.cipher);
  if (!cipher) return fail("unknown cipher " + cfg.cipher);

  // find the files to send offsite
  std::vector<std::string> files;
  rc = pack::select_backup_files(cfg.backup_dir, files);
  if (rc != 0) {
    util::log_msg(LOG_ERR, "can't read backup directory %s: %s", cfg.backup_dir.c_str(), std::strerror(-rc));
    util::log_close();
    return 1;
  }

  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  pack::PackOptions opt;
  opt.work_dir = cfg.work_dir;
  opt.limits = cfg.limits;
  opt.pass_file = cfg.pass_file;
  opt.dry_run = cfg.dry_run;
  opt.cancel = &g_cancel;

  pack::PackResult res;
  rc = pack::pack_files(files, opt, *cipher, res);
  if (rc == 0) {
    util::log_msg(LOG_INFO, "created %d sets of files", res.volumes);
  } else if (rc == -ECANCELED) {
    util::log_msg(LOG_WARNING, "interrupted after %d sets of files", res.volumes);
  }
  if (res.failed_parts > 0 || res.skipped_files > 0) {
    util::log_msg(LOG_ERR, "%d of %d parts failed, %d files skipped",
                  res.failed_parts, res.parts, res.skipped_files);
  }

  util::log_close();
  return (rc == 0 && res.ok()) ? 0 : 1;
}
