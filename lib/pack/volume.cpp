#include <string>
#include <sys/stat.h>
#include <utility>

#include "pack/volume.hpp"
#include "util.hpp"

namespace pack {

VolumeAllocator::VolumeAllocator(std::string work_dir, const Limits& lim, bool create_dirs)
  : work_dir_(util::rstrip_slash(std::move(work_dir))), lim_(lim), create_dirs_(create_dirs) {}

std::string VolumeAllocator::volume_dir(int volume) const {
  return work_dir_ + "/" + std::to_string(volume);
}

int VolumeAllocator::ensure_capacity(bool& opened){
  opened = false;
  if (!needs_rollover(st_.remaining, lim_.block_size)) return 0;

  int next = st_.volume + 1;
  if (create_dirs_) {
    int rc = util::fs::make_dir(volume_dir(next).c_str(), 0755);
    if (rc != 0) return rc;
  }

  st_.volume = next;
  st_.remaining = lim_.volume_capacity;
  opened = true;
  return 0;
}

Reservation VolumeAllocator::reserve(uint64_t& file_left){
  Take t = take(st_.remaining, file_left, lim_);
  file_left -= t.copy;
  st_.remaining -= t.copy;
  return Reservation{t.copy, t.to_eof};
}

}
