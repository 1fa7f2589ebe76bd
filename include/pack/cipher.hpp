#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace pack {

// Encrypts one byte range of a source file into a new destination file.
class PartCipher {
public:
  virtual ~PartCipher() = default;

  // Appended to every destination name, e.g. ".gpg"
  virtual const char* suffix() const = 0;

  // length == 0 copies to end of file. The passphrase is read from
  // pass_file once per call. 0 or -errno; a failed call leaves no
  // destination behind.
  virtual int encrypt(const std::string& source, const std::string& dest,
                      uint64_t offset, uint64_t length,
                      const std::string& pass_file) = 0;
};

// External gpg, symmetric mode, passphrase on fd 3, no compression.
// SIGPIPE must be ignored by the process.
class GpgCipher : public PartCipher {
public:
  explicit GpgCipher(std::string program = "gpg");

  const char* suffix() const override { return ".gpg"; }
  int encrypt(const std::string& source, const std::string& dest,
              uint64_t offset, uint64_t length,
              const std::string& pass_file) override;

  std::vector<std::string> argv(const std::string& dest) const;

private:
  std::string program_;
};

// In-process AES-256-GCM chunked container, see enc/header.hpp.
class AesCipher : public PartCipher {
public:
  const char* suffix() const override { return ".aes"; }
  int encrypt(const std::string& source, const std::string& dest,
              uint64_t offset, uint64_t length,
              const std::string& pass_file) override;
};

struct PartRequest {
  std::string source;
  std::string dest;
  std::string pass_file;
  uint64_t block_size = 0;
  uint64_t offset_blocks = 0;
  uint64_t copy_blocks = 0;       // 0 = to end of file
};

// Extracts and encrypts one part; logs failures. Dry run does nothing.
int encrypt_range(PartCipher& cipher, const PartRequest& req, bool dry_run);

}
