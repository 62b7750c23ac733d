#include "random.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace fleet::util {

std::vector<uint8_t> RandomBytes(std::size_t n) {
  std::vector<uint8_t> out(n);
  if (n > 0 && RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

std::string HexEncode(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

std::string RandomHex(std::size_t n) {
  auto bytes = RandomBytes(n);
  return HexEncode(bytes.data(), bytes.size());
}

std::string UrlSafeToken(std::size_t n) {
  auto bytes = RandomBytes(n);

  // EVP_EncodeBlock writes 4 output chars per 3 input bytes plus a NUL.
  std::string encoded(4 * ((n + 2) / 3) + 1, '\0');
  const int   len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()), bytes.data(), static_cast<int>(n));
  encoded.resize(static_cast<std::size_t>(len));

  while (!encoded.empty() && encoded.back() == '=') encoded.pop_back();
  for (auto& c : encoded) {
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
  }
  return encoded;
}

bool IsLowerHex(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) return false;
  }
  return true;
}

} // namespace fleet::util
