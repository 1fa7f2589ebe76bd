#include <cstring>

#include "pack/cipher.hpp"
#include "log.hpp"

namespace pack {

int encrypt_range(PartCipher& cipher, const PartRequest& req, bool dry_run){
  if (dry_run) return 0;

  uint64_t offset = req.offset_blocks * req.block_size;
  uint64_t length = req.copy_blocks * req.block_size;

  int rc = cipher.encrypt(req.source, req.dest, offset, length, req.pass_file);
  if (rc != 0) {
    util::log_msg(LOG_ERR, "encrypt of %s (%llu blocks @ offset %llu blocks) failed: %s",
                  req.source.c_str(),
                  (unsigned long long)req.copy_blocks,
                  (unsigned long long)req.offset_blocks,
                  std::strerror(-rc));
  }
  return rc;
}

}
