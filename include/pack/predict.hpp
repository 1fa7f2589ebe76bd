#pragma once
#include <cstdint>

namespace pack {

struct Limits {
  uint64_t volume_capacity = 0;   // bytes per volume
  uint64_t max_file_size   = 0;   // bytes per part
  uint64_t block_size      = 0;   // alignment of capped parts
};

// 0 or -EINVAL
int validate_limits(const Limits& lim);

struct Take {
  uint64_t copy = 0;
  bool to_eof = false;            // rest of the file fits, copy == file_left
};

struct Step {
  uint64_t copy = 0;
  bool to_eof = false;
  bool rolled = false;            // a fresh volume was opened first
};

// Allocation rules shared by the predictor and the allocator. The allocator
// calls the two halves separately because it has to create the volume
// directory in between.
constexpr bool needs_rollover(uint64_t remaining, uint64_t block_size){
  return remaining < block_size;
}

Take take(uint64_t remaining, uint64_t file_left, const Limits& lim);

Step step_once(uint64_t& remaining, uint64_t& file_left, const Limits& lim);

// Number of parts a file of file_size bytes is cut into when
// bytes_available_now bytes are left in the open volume (0 if none is open).
uint64_t predict_parts(uint64_t file_size, uint64_t bytes_available_now, const Limits& lim);

}
