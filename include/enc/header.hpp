#pragma once
#include <cstdint>
#include <cstddef>
#include <array>
#include "params.hpp"

namespace enc {

#pragma pack(push, 1)
struct Header {
  uint8_t  magic[8];        // "OFFPACK1"
  uint32_t version;         // 1
  uint32_t chunk_sz;        // 65536
  uint8_t  salt[SALT_SIZE]; // per-part
  uint32_t kdf_iter;        // PBKDF2 rounds
  uint8_t  reserved[20];    // future / alignment
  uint64_t plain_len_be;    // big-endian
};
#pragma pack(pop)

inline constexpr size_t HEADER_SIZE = sizeof(Header);
static_assert(HEADER_SIZE == 64, "Header layout/size mismatch");

// Fills magic, version, chunk size, KDF rounds and a fresh salt.
int init_header(Header& h, uint64_t plain_len);

int read_header(int fd, Header& h);
int write_header(int fd, const Header& h);

// magic[8] || be32(version) || be32(chunk_sz) || salt
void make_aad_prefix(const Header& h, std::array<uint8_t, AAD_PREFIX_LEN>& out);

} // namespace enc
