#include <algorithm>
#include <cerrno>

#include "pack/predict.hpp"

namespace pack {

int validate_limits(const Limits& lim){
  if (lim.block_size == 0) return -EINVAL;
  if (lim.max_file_size < lim.block_size) return -EINVAL;
  if (lim.volume_capacity < lim.block_size) return -EINVAL;
  return 0;
}

Take take(uint64_t remaining, uint64_t file_left, const Limits& lim){
  Take t{};
  const uint64_t room = std::min(remaining, lim.max_file_size);

  if (file_left >= room) {
    // fills this volume (or the per-file ceiling), round down to blocks
    uint64_t blocks = remaining / lim.block_size;
    uint64_t cap = lim.max_file_size / lim.block_size;
    if (blocks > cap) blocks = cap;
    t.copy = blocks * lim.block_size;
  } else {
    t.copy = file_left;
    t.to_eof = true;
  }
  return t;
}

Step step_once(uint64_t& remaining, uint64_t& file_left, const Limits& lim){
  Step s{};
  if (needs_rollover(remaining, lim.block_size)) {
    remaining = lim.volume_capacity;
    s.rolled = true;
  }

  Take t = take(remaining, file_left, lim);
  s.copy = t.copy;
  s.to_eof = t.to_eof;
  file_left -= t.copy;
  remaining -= t.copy;
  return s;
}

uint64_t predict_parts(uint64_t file_size, uint64_t bytes_available_now, const Limits& lim){
  if (validate_limits(lim) != 0) return 0;

  uint64_t remaining = bytes_available_now;
  uint64_t left = file_size;
  uint64_t parts = 0;
  while (left > 0) {
    step_once(remaining, left, lim);
    parts++;
  }
  return parts;
}

}
