#pragma once
#include <cstddef>
#include <string>
#include <cstdint>
#include <array>
#include <sys/types.h>
#include <unistd.h>

#include "enc/params.hpp"

namespace util {

std::string expand_args(const std::string& path);

std::string rstrip_slash(std::string p);

// Last path component, as basename(1) without suffix handling
std::string base_name(const std::string& path);

// Decimal byte count, no sign, no trailing junk. Returns 0 or -EINVAL/-ERANGE.
int parse_u64(const std::string& s, uint64_t& out);

namespace enc {

// Ensure randomness has enough size
int fill_rand(void* p, size_t n);

// Endian helpers
uint64_t htobe_u64(uint64_t x);
uint32_t htobe_u32(uint32_t x);
uint64_t be64toh_u64(uint64_t x);


// Nonce for chunk i = nonce_base with last 8 bytes XOR chunk_index (big-endian)
void make_chunk_nonce(const std::array<uint8_t,::enc::NONCE_SIZE>& base,
                      uint64_t chunk_idx,
                      uint8_t out[::enc::NONCE_SIZE]);

}


namespace fs {

// Byte offset of ciphertext chunk i behind the container header
uint64_t cipher_chunk_off(uint64_t i, size_t sz);

ssize_t full_pread(int fd, void *buf, size_t n, off_t offset);
ssize_t full_pwrite(int fd, const void *buf, size_t n, off_t offset);

// write(2) loop for pipes; 0 or -errno
int full_write(int fd, const void *buf, size_t n);

// mkdir that accepts an existing directory. 0 or -errno
int make_dir(const char *path, mode_t mode);

// Create (one level) if missing, else require a writable directory. 0 or -errno
int check_work_dir(const char *path);

}

}
