#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>
#include <openssl/crypto.h>

#include "enc/crypto.hpp"
#include "enc/header.hpp"
#include "enc/params.hpp"
#include "pack/cipher.hpp"
#include "util.hpp"

namespace pack {

int AesCipher::encrypt(const std::string& source, const std::string& dest,
                       uint64_t offset, uint64_t length,
                       const std::string& pass_file){
  std::string pass;
  int rc = enc::load_passphrase(pass_file.c_str(), pass);
  if (rc != 0) return rc;

  int in = open(source.c_str(), O_RDONLY | O_CLOEXEC);
  if (in == -1) {
    int se = errno;
    OPENSSL_cleanse(&pass[0], pass.size());
    return -se;
  }

  struct stat st{};
  if (fstat(in, &st) == -1) {
    int se = errno;
    OPENSSL_cleanse(&pass[0], pass.size());
    close(in);
    return -se;
  }

  // Range must lie inside the file as it is now
  uint64_t size = static_cast<uint64_t>(st.st_size);
  uint64_t plain_len = length;
  if (offset > size || (length > 0 && length > size - offset)) {
    OPENSSL_cleanse(&pass[0], pass.size());
    close(in);
    return -ENODATA;
  }
  if (length == 0) plain_len = size - offset;

  enc::Header h{};
  std::array<uint8_t, enc::KEY_SIZE> master{};
  std::array<uint8_t, enc::KEY_SIZE> file_key{};
  std::array<uint8_t, enc::NONCE_SIZE> nonce_base{};
  std::array<uint8_t, enc::AAD_PREFIX_LEN> aad_prefix{};
  int out = -1;
  rc = -EIO;

  do {
    if (enc::init_header(h, plain_len) != 0) break;
    if (enc::derive_master_key(pass, h.salt, h.kdf_iter, master) != 0) break;
    if (enc::derive_file_material(master, h.salt, file_key, nonce_base) != 0) break;
    OPENSSL_cleanse(master.data(), master.size());
    enc::make_aad_prefix(h, aad_prefix);

    out = open(dest.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (out == -1) { rc = -errno; break; }

    if (enc::write_header(out, h) != 0) { rc = -EIO; break; }

    const size_t csz = h.chunk_sz;
    std::vector<uint8_t> pbuf(csz);
    std::vector<uint8_t> cbuf(enc::NONCE_SIZE + csz + enc::TAG_SIZE);
    uint64_t done = 0;
    uint64_t i = 0;
    bool failed = false;

    while (done < plain_len) {
      size_t plain = csz;
      if (plain_len - done < plain) plain = static_cast<size_t>(plain_len - done);

      ssize_t rn = util::fs::full_pread(in, pbuf.data(), plain, static_cast<off_t>(offset + done));
      if (rn != static_cast<ssize_t>(plain)) { rc = (rn < 0) ? -errno : -ENODATA; failed = true; break; }

      uint8_t *nonce = cbuf.data();
      uint8_t *ct = cbuf.data() + enc::NONCE_SIZE;
      uint8_t *tag = ct + plain;
      util::enc::make_chunk_nonce(nonce_base, i, nonce);

      uint8_t aad[enc::AAD_PREFIX_LEN + 8];
      std::memcpy(aad, aad_prefix.data(), enc::AAD_PREFIX_LEN);
      uint64_t i_be = util::enc::htobe_u64(i);
      std::memcpy(aad + enc::AAD_PREFIX_LEN, &i_be, 8);

      if (enc::aesgcm_encrypt(file_key.data(), nonce,
                              pbuf.data(), plain,
                              aad, enc::AAD_PREFIX_LEN + 8,
                              ct, tag) != 0) { rc = -EIO; failed = true; break; }

      const size_t clen = enc::NONCE_SIZE + plain + enc::TAG_SIZE;
      uint64_t coffset = util::fs::cipher_chunk_off(i, csz);
      ssize_t wn = util::fs::full_pwrite(out, cbuf.data(), clen, static_cast<off_t>(coffset));
      if (wn != static_cast<ssize_t>(clen)) {
        rc = (wn < 0) ? -errno : -EIO;
        failed = true;
        break;
      }

      done += plain;
      i++;
    }
    OPENSSL_cleanse(pbuf.data(), pbuf.size());
    if (failed) break;

    if (fdatasync(out) == -1) { rc = -errno; break; }
    rc = 0;
  } while(0);

  OPENSSL_cleanse(&pass[0], pass.size());
  OPENSSL_cleanse(master.data(), master.size());
  OPENSSL_cleanse(file_key.data(), file_key.size());
  OPENSSL_cleanse(nonce_base.data(), nonce_base.size());
  close(in);

  if (out != -1) {
    if (close(out) == -1 && rc == 0) rc = -errno;
    if (rc != 0) unlink(dest.c_str());
  }
  return rc;
}

}
