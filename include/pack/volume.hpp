#pragma once
#include <cstdint>
#include <string>

#include "pack/predict.hpp"

namespace pack {

// Rolling placement state of one packing run
struct PackingState {
  int      volume    = 0;   // 0 until the first volume opens
  uint64_t remaining = 0;   // bytes left in the open volume
};

struct Reservation {
  uint64_t copy = 0;
  bool to_eof = false;
};

class VolumeAllocator {
public:
  VolumeAllocator(std::string work_dir, const Limits& lim, bool create_dirs);

  // Opens the next volume when fewer than block_size bytes are left.
  // 0 or -errno when the volume directory cannot be created.
  int ensure_capacity(bool& opened);

  // Places as much of file_left as the open volume takes; file_left is
  // reduced by the reserved amount.
  Reservation reserve(uint64_t& file_left);

  std::string volume_dir(int volume) const;

  const PackingState& state() const { return st_; }
  const Limits& limits() const { return lim_; }

private:
  std::string work_dir_;
  Limits lim_;
  bool create_dirs_;
  PackingState st_;
};

}
