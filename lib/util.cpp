#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <pwd.h>
#include <sys/random.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <array>
#include <cstring>
#include <limits>

#include "util.hpp"
#include "enc/header.hpp"


namespace util {

std::string expand_args(const std::string& path) {
  if (path.empty() || path[0] != '~') return path;

  if (path.size() == 1 || path[1] == '/') {
      const char* h = std::getenv("HOME");
      if (!h) {
          if (auto* pw = getpwuid(getuid())) h = pw->pw_dir;
      }
      return (h ? std::string(h) : std::string()) + path.substr(1);
  }

  size_t slash = path.find('/');
  std::string user = path.substr(1, (slash == std::string::npos ? std::string::npos : slash - 1));
  if (auto* pw = getpwnam(user.c_str())) {
      std::string home = pw->pw_dir;
      return home + (slash == std::string::npos ? "" : path.substr(slash));
  }
  return path;
}

std::string rstrip_slash(std::string p) {
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

std::string base_name(const std::string& path) {
  std::string p = rstrip_slash(path);
  size_t slash = p.rfind('/');
  if (slash == std::string::npos || p.size() == 1) return p;
  return p.substr(slash + 1);
}

int parse_u64(const std::string& s, uint64_t& out) {
  if (s.empty()) return -EINVAL;
  uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return -EINVAL;
    uint64_t d = static_cast<uint64_t>(c - '0');
    if (v > (std::numeric_limits<uint64_t>::max() - d) / 10) return -ERANGE;
    v = v * 10 + d;
  }
  out = v;
  return 0;
}

}

namespace util::fs {

uint64_t cipher_chunk_off(uint64_t i, size_t sz){
  return ::enc::HEADER_SIZE + i * static_cast<uint64_t>(::enc::NONCE_SIZE + sz + ::enc::TAG_SIZE);
}

ssize_t full_pread(int fd, void *buf, size_t n, off_t offset){
  uint8_t *p = static_cast<uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t r = pread(fd, p+done, n-done, offset + (off_t)done);
    if (r < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (r == 0) break; // EOF
    done += (size_t)r;
  }
  return (ssize_t)done;
}

ssize_t full_pwrite(int fd, const void *buf, size_t n, off_t offset){
  const uint8_t *p = static_cast<const uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t w = pwrite(fd, p+done, n-done, offset + (off_t)done);
    if (w < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (w == 0) break;
    done += (size_t)w;
  }
  return (ssize_t)done;
}

int full_write(int fd, const void *buf, size_t n){
  const uint8_t *p = static_cast<const uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t w = write(fd, p+done, n-done);
    if (w < 0){
      if (errno==EINTR) continue;
      return -errno;
    }
    done += (size_t)w;
  }
  return 0;
}

int make_dir(const char *path, mode_t mode){
  if (mkdir(path, mode) == 0) return 0;
  int se = errno;
  if (se != EEXIST) return -se;

  // Only an existing directory is acceptable
  struct stat st{};
  if (stat(path, &st) == -1) return -errno;
  return S_ISDIR(st.st_mode) ? 0 : -ENOTDIR;
}

int check_work_dir(const char *path){
  struct stat st{};
  if (stat(path, &st) == -1){
    if (errno != ENOENT) return -errno;
    return (mkdir(path, 0755) == 0) ? 0 : -errno;
  }
  if (!S_ISDIR(st.st_mode)) return -ENOTDIR;
  if (access(path, W_OK | X_OK) == -1) return -errno;
  return 0;
}

}

namespace util::enc {

int fill_rand(void *p, size_t n){
  uint8_t *out = static_cast<uint8_t*>(p);
  size_t off = 0;
  while(off < n){
    ssize_t m = getrandom(out + off, n - off, 0);
    if (m < 0){
      if (errno == EINTR) continue;
      return -1;
    }
    off += static_cast<size_t>(m);
  }
  return 0;
}


uint64_t htobe_u64(uint64_t x){
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return __builtin_bswap64(x);
#else
  return x;
#endif

}
uint32_t htobe_u32(uint32_t x){
#if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
  return __builtin_bswap32(x);
#else
  return x;
#endif

}


uint64_t be64toh_u64(uint64_t x){
return htobe_u64(x);
}

void make_chunk_nonce(const std::array<uint8_t,::enc::NONCE_SIZE>& base,
                      uint64_t idx,
                      uint8_t out[::enc::NONCE_SIZE]) {
  // Copy base, XOR the last 8 bytes with big-endian idx
  std::memcpy(out, base.data(), ::enc::NONCE_SIZE);
  uint64_t be = htobe_u64(idx);
  const uint8_t *b = reinterpret_cast<const uint8_t*>(&be);
  for (size_t i=0;i<8;i++) out[::enc::NONCE_SIZE-8+i] ^= b[i];
}

}
