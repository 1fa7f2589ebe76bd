#include "offpack/dispatch.hpp"

namespace offpack {

std::unique_ptr<pack::PartCipher> make_cipher(const std::string& name){
  if (name == "gpg") return std::make_unique<pack::GpgCipher>();
  if (name == "aes") return std::make_unique<pack::AesCipher>();
  return nullptr;
}

} // namespace
