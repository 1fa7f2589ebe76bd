#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <string>
#include <sys/stat.h>
#include <unordered_set>
#include <vector>

#include "pack/driver.hpp"
#include "pack/volume.hpp"
#include "log.hpp"
#include "util.hpp"

namespace pack {

std::string dest_name(const std::string& work_dir, int volume,
                      const std::string& source, int part, int total,
                      const char* suffix){
  std::string name = util::rstrip_slash(work_dir) + "/" + std::to_string(volume) + "/" + util::base_name(source);
  if (total > 1) {
    char tag[32];
    std::snprintf(tag, sizeof(tag), ".%02dof%02d", part, total);
    name += tag;
  }
  return name + suffix;
}

static bool cancelled(const PackOptions& opt){
  return opt.cancel && opt.cancel->load();
}

int pack_files(const std::vector<std::string>& files, const PackOptions& opt,
               PartCipher& cipher, PackResult& res){
  res = PackResult{};
  const Limits& lim = opt.limits;
  if (validate_limits(lim) != 0) {
    util::log_msg(LOG_ERR, "invalid limits: image %llu, file %llu, block %llu",
                  (unsigned long long)lim.volume_capacity,
                  (unsigned long long)lim.max_file_size,
                  (unsigned long long)lim.block_size);
    return -EINVAL;
  }

  VolumeAllocator alloc(opt.work_dir, lim, !opt.dry_run);
  std::unordered_set<std::string> names;   // destinations in the open volume

  for (const auto& file : files) {
    struct stat st{};
    if (stat(file.c_str(), &st) == -1) {
      util::log_msg(LOG_ERR, "can't stat %s: %s", file.c_str(), std::strerror(errno));
      res.skipped_files++;
      continue;
    }
    uint64_t file_left = static_cast<uint64_t>(st.st_size);
    if (file_left == 0) {
      util::log_msg(LOG_WARNING, "%s is empty, nothing to copy", file.c_str());
      continue;
    }

    // part numbers and counters are int; every part holds at most
    // max_file_size bytes, so refuse before simulating the cut
    const uint64_t room = static_cast<uint64_t>(INT_MAX - res.parts);
    uint64_t total = (file_left / lim.max_file_size >= room)
                       ? room + 1 : predict_parts(file_left, alloc.state().remaining, lim);
    if (total > room) {
      util::log_msg(LOG_ERR, "%s needs too many parts with file size %llu, block %llu",
                    file.c_str(), (unsigned long long)lim.max_file_size,
                    (unsigned long long)lim.block_size);
      res.skipped_files++;
      continue;
    }
    uint64_t offset_blocks = 0;

    for (int part = 1; part <= static_cast<int>(total); part++) {
      if (cancelled(opt)) {
        util::log_msg(LOG_WARNING, "cancelled before part %d of %s", part, file.c_str());
        res.cancelled = true;
        res.volumes = alloc.state().volume;
        return -ECANCELED;
      }

      // roll over to next volume if no blocks remain in this one
      bool opened = false;
      int rc = alloc.ensure_capacity(opened);
      if (rc != 0) {
        util::log_msg(LOG_ERR, "can't create work directory %s: %s",
                      alloc.volume_dir(alloc.state().volume + 1).c_str(), std::strerror(-rc));
        res.volumes = alloc.state().volume;
        return rc;
      }
      if (opened) {
        util::log_msg(LOG_DEBUG, "--- starting volume %d", alloc.state().volume);
        names.clear();
      }

      Reservation r = alloc.reserve(file_left);
      uint64_t copy_blocks = r.to_eof ? 0 : r.copy / lim.block_size;

      std::string dest = dest_name(opt.work_dir, alloc.state().volume, file, part, static_cast<int>(total), cipher.suffix());
      util::log_msg(opt.dry_run ? LOG_INFO : LOG_DEBUG, "%s: %llu @ %llu",
                    dest.c_str(), (unsigned long long)copy_blocks, (unsigned long long)offset_blocks);
      res.parts++;

      if (!names.insert(dest).second) {
        util::log_msg(LOG_ERR, "%s already used in volume %d, not writing part %d of %s",
                      dest.c_str(), alloc.state().volume, part, file.c_str());
        res.failed_parts++;
      } else {
        PartRequest req{file, dest, opt.pass_file, lim.block_size, offset_blocks, copy_blocks};
        if (encrypt_range(cipher, req, opt.dry_run) != 0) res.failed_parts++;
      }

      offset_blocks += r.copy / lim.block_size;
    }
  }

  res.volumes = alloc.state().volume;
  return 0;
}

}
