#include <algorithm>
#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <map>
#include <set>
#include <string>
#include <sys/stat.h>
#include <vector>

#include "pack/select.hpp"
#include "log.hpp"
#include "util.hpp"

namespace pack {

bool parse_archive_name(const std::string& name, Archive& out){
  static const std::string ext = ".bz2";
  if (name.size() <= ext.size() || name.compare(name.size() - ext.size(), ext.size(), ext) != 0)
    return false;

  size_t d1 = name.find('.');
  if (d1 == 0 || d1 == std::string::npos) return false;
  size_t d2 = name.find('.', d1 + 1);
  if (d2 == std::string::npos || d2 == d1 + 1) return false;

  out.fs = name.substr(0, d1);
  out.level = name.substr(d1 + 1, d2 - d1 - 1);
  return true;
}

static bool newer(const struct stat& a, const struct stat& b){
  if (a.st_mtim.tv_sec != b.st_mtim.tv_sec) return a.st_mtim.tv_sec > b.st_mtim.tv_sec;
  return a.st_mtim.tv_nsec > b.st_mtim.tv_nsec;
}

int select_backup_files(const std::string& backup_dir, std::vector<std::string>& out){
  out.clear();
  const std::string dir = util::rstrip_slash(backup_dir);

  DIR* d = opendir(dir.c_str());
  if (!d) return -errno;

  // fs id -> archive names, one map per level
  std::map<std::string, std::vector<std::string>> level0, level1;
  std::set<std::string> seen;

  int rd_err = 0;
  for (;;) {
    errno = 0;
    struct dirent* e = readdir(d);
    if (!e) { rd_err = errno; break; }

    Archive a;
    if (!parse_archive_name(e->d_name, a)) continue;

    struct stat st{};
    if (fstatat(dirfd(d), e->d_name, &st, 0) == -1 || !S_ISREG(st.st_mode)) continue;

    seen.insert(a.fs);
    if (a.level == "0") level0[a.fs].push_back(e->d_name);
    else if (a.level == "1") level1[a.fs].push_back(e->d_name);
  }
  closedir(d);
  if (rd_err != 0) return -rd_err;

  for (const auto& fs : seen) {
    auto l0 = level0.find(fs);
    if (l0 == level0.end()) {
      util::log_msg(LOG_ERR, "no level 0 backup found for %s", fs.c_str());
      continue;
    }
    std::string full = dir + "/" + *std::max_element(l0->second.begin(), l0->second.end());
    out.push_back(full);

    auto l1 = level1.find(fs);
    if (l1 == level1.end()) continue;

    struct stat st0{};
    if (stat(full.c_str(), &st0) == -1) continue;

    std::vector<std::string> names = l1->second;
    std::sort(names.begin(), names.end());
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
      std::string path = dir + "/" + *it;
      struct stat st1{};
      if (stat(path.c_str(), &st1) == 0 && newer(st1, st0)) {
        out.push_back(path);
        break;
      }
    }
  }
  return 0;
}

}
