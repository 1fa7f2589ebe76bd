#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "pack/cipher.hpp"
#include "pack/predict.hpp"

namespace pack {

struct PackOptions {
  std::string work_dir;
  Limits limits;
  std::string pass_file;
  bool dry_run = false;                     // plan only, no directories or files
  const std::atomic<bool>* cancel = nullptr; // polled between parts
};

struct PackResult {
  int volumes = 0;          // highest volume number opened
  int parts = 0;            // parts placed, including failed ones
  int failed_parts = 0;
  int skipped_files = 0;
  bool cancelled = false;

  bool ok() const { return failed_parts == 0 && skipped_files == 0 && !cancelled; }
};

// <work_dir>/<volume>/<base><suffix>, or <base>.<NNofMM><suffix> when split
std::string dest_name(const std::string& work_dir, int volume,
                      const std::string& source, int part, int total,
                      const char* suffix);

// Packs files in order into numbered volume directories under
// opt.work_dir. Per-part failures are counted in res and do not stop the
// run. Returns 0, -EINVAL for bad limits, -ECANCELED, or the -errno of a
// volume directory that could not be created.
int pack_files(const std::vector<std::string>& files, const PackOptions& opt,
               PartCipher& cipher, PackResult& res);

}
