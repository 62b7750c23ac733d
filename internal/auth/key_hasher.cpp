#include "internal/auth/key_hasher.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <charconv>
#include <stdexcept>
#include <vector>

#include "internal/util/random.hpp"

namespace fleet::auth {

namespace {

constexpr std::string_view kScheme     = "pbkdf2_sha256";
constexpr std::size_t      kSaltBytes  = 16;
constexpr std::size_t      kDigestSize = 32;

std::vector<uint8_t> Derive(std::string_view plain_key, const std::vector<uint8_t>& salt, uint32_t iterations) {
  std::vector<uint8_t> out(kDigestSize);
  if (PKCS5_PBKDF2_HMAC(plain_key.data(), static_cast<int>(plain_key.size()), salt.data(), static_cast<int>(salt.size()),
                        static_cast<int>(iterations), EVP_sha256(), static_cast<int>(out.size()), out.data()) != 1) {
    throw std::runtime_error("PBKDF2 derivation failed");
  }
  return out;
}

bool HexDecode(std::string_view hex, std::vector<uint8_t>* out) {
  if (hex.size() % 2 != 0 || !util::IsLowerHex(hex)) return false;
  out->clear();
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    uint8_t byte = 0;
    auto [_, ec] = std::from_chars(hex.data() + i, hex.data() + i + 2, byte, 16);
    if (ec != std::errc()) return false;
    out->push_back(byte);
  }
  return true;
}

} // namespace

KeyHasher::KeyHasher(uint32_t iterations) : iterations_(iterations == 0 ? 1 : iterations) {
}

std::string KeyHasher::Hash(std::string_view plain_key) const {
  const auto salt   = util::RandomBytes(kSaltBytes);
  const auto digest = Derive(plain_key, salt, iterations_);
  return std::string(kScheme) + "$" + std::to_string(iterations_) + "$" + util::HexEncode(salt.data(), salt.size()) + "$" +
         util::HexEncode(digest.data(), digest.size());
}

bool KeyHasher::Verify(std::string_view plain_key, std::string_view encoded) const {
  // scheme$iterations$salt$hash
  std::string_view parts[4];
  std::size_t      start = 0;
  for (int i = 0; i < 3; ++i) {
    const auto sep = encoded.find('$', start);
    if (sep == std::string_view::npos) return false;
    parts[i] = encoded.substr(start, sep - start);
    start    = sep + 1;
  }
  parts[3] = encoded.substr(start);
  if (parts[0] != kScheme) return false;

  uint32_t iterations = 0;
  auto [ptr, ec]      = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(), iterations);
  if (ec != std::errc() || ptr != parts[1].data() + parts[1].size() || iterations == 0) return false;

  std::vector<uint8_t> salt;
  std::vector<uint8_t> expected;
  if (!HexDecode(parts[2], &salt) || !HexDecode(parts[3], &expected) || expected.size() != kDigestSize) return false;

  const auto actual = Derive(plain_key, salt, iterations);
  return CRYPTO_memcmp(actual.data(), expected.data(), kDigestSize) == 0;
}

} // namespace fleet::auth
