#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fleet::util {

/*
  Cryptographically secure random helpers (OpenSSL RAND_bytes).

  Throws std::runtime_error when the CSPRNG cannot produce output.
*/

std::vector<uint8_t> RandomBytes(std::size_t n);

// Lowercase hex of n random bytes (2n characters).
std::string RandomHex(std::size_t n);

// Unpadded base64url of n random bytes. Safe in URLs and key strings.
std::string UrlSafeToken(std::size_t n);

std::string HexEncode(const uint8_t* data, std::size_t size);
bool        IsLowerHex(std::string_view s);

} // namespace fleet::util
