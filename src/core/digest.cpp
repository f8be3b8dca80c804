#include "cdl/core/digest.hpp"

#include <array>

#include <openssl/evp.h>

namespace cdl::core {

auto sha256_hex(std::string_view data) -> std::string {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int md_len = 0;
  // EVP_Digest fails only when libcrypto cannot allocate; ids stay well-formed (all zeros).
  if (EVP_Digest(data.data(), data.size(), md.data(), &md_len, EVP_sha256(), nullptr) != 1) {
    md.fill(0);
    md_len = 32;
  }

  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(static_cast<std::size_t>(md_len) * 2);
  for (unsigned int i = 0; i < md_len; ++i) {
    out.push_back(kHex[(md[i] >> 4) & 0x0F]);
    out.push_back(kHex[md[i] & 0x0F]);
  }
  return out;
}

auto short_digest(std::string_view data, std::size_t chars) -> std::string {
  auto hex = sha256_hex(data);
  if (chars < hex.size()) hex.resize(chars);
  return hex;
}

} // namespace cdl::core
