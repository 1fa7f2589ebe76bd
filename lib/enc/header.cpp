#include <sys/types.h>
#include <unistd.h>
#include <cstring>

#include "enc/header.hpp"
#include "util.hpp"

namespace enc {

static const uint8_t MAGIC[8] = {'O','F','F','P','A','C','K','1'};

int init_header(Header& h, uint64_t plain_len){
  std::memset(&h, 0, sizeof(h));
  std::memcpy(h.magic, MAGIC, 8);
  h.version = ENC_VERSION;
  h.chunk_sz = CHUNK_SIZE;
  h.kdf_iter = KDF_ITERATIONS;
  if (util::enc::fill_rand(h.salt, SALT_SIZE) != 0) return -1;
  h.plain_len_be = util::enc::htobe_u64(plain_len);
  return 0;
}

int read_header(int fd, Header& h){
  ssize_t n = util::fs::full_pread(fd, &h, sizeof(h), 0);
  if (n != (ssize_t)sizeof(h)) return -1;

  if (std::memcmp(h.magic, MAGIC, 8)!=0) return -2;
  if (h.version != ENC_VERSION) return -3;
  if (h.chunk_sz == 0 || h.chunk_sz > (8u<<20)) return -4; // sanity
  if (h.kdf_iter == 0) return -5;
  return 0;
}

int write_header(int fd, const Header& h){
  return (util::fs::full_pwrite(fd, &h, sizeof(h), 0) == (ssize_t)sizeof(h)) ? 0 : -1;
}

void make_aad_prefix(const Header& h, std::array<uint8_t, AAD_PREFIX_LEN>& out){
  std::memcpy(out.data(), h.magic, 8);

  uint32_t v_be = util::enc::htobe_u32(h.version);
  std::memcpy(out.data() + 8, &v_be, 4);

  uint32_t sz_be = util::enc::htobe_u32(h.chunk_sz);
  std::memcpy(out.data() + 12, &sz_be, 4);

  std::memcpy(out.data() + 16, h.salt, SALT_SIZE);
}

}
