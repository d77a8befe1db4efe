#ifndef CRYPTO_H
#define CRYPTO_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "config.h"

using Hash = std::array<uint8_t, Refund::HASH_SIZE>;

// digest by OpenSSL algorithm name ("SHA3-256", "KECCAK-256", "SHA256", ...)
std::vector<uint8_t> DigestBytes(const std::string& algorithm, const std::vector<uint8_t>& data);

// 32 byte digest, throws if the algorithm produces any other size
Hash HashBytes(const std::string& algorithm, const std::vector<uint8_t>& data);

// same, with the configured algorithm (Config::GetDigestName)
Hash HashBytes(const std::vector<uint8_t>& data);

// digest of min(a, b) | max(a, b)
Hash HashSortedPair(const std::string& algorithm, const Hash& a, const Hash& b);
Hash HashSortedPair(const Hash& a, const Hash& b);

bool IsZeroHash(const Hash& hash);

#endif
