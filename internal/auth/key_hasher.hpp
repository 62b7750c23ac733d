#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fleet::auth {

/*
  Salted PBKDF2-HMAC-SHA256 over the whole plain key.

  Encoded form: pbkdf2_sha256$<iterations>$<salt hex>$<hash hex>
  The iteration count travels with the hash, so changing the default
  never invalidates existing credentials.
*/
class KeyHasher {
 public:
  static constexpr uint32_t kDefaultIterations = 100000;

  explicit KeyHasher(uint32_t iterations = kDefaultIterations);

  std::string Hash(std::string_view plain_key) const;

  // Constant-time comparison; false on any malformed encoding.
  bool Verify(std::string_view plain_key, std::string_view encoded) const;

 private:
  uint32_t iterations_;
};

} // namespace fleet::auth
