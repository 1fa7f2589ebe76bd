#pragma once
#include <memory>
#include <string>

#include "pack/cipher.hpp"

namespace offpack {

// "gpg" or "aes"; nullptr for anything else
std::unique_ptr<pack::PartCipher> make_cipher(const std::string& name);

}
