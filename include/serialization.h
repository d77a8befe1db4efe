#ifndef SERIALIZATION_H
#define SERIALIZATION_H

#include <cstdint>
#include <string>
#include <vector>

#include "crypto.h"

// hex string conversions, no prefix
std::string ByteArrayToHexString(const std::vector<uint8_t>& bytes);

// strict: throws std::invalid_argument on odd length or a non-hex digit
std::vector<uint8_t> HexStringToByteArray(const std::string& hex);

// "0x" prefixed forms used on the wire and in commitment files
std::string ToPrefixedHex(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> FromPrefixedHex(const std::string& hex);

std::string HashToHex(const Hash& hash);

// throws RefundError(InvalidHash) unless the input is 0x + 64 hex digits
Hash ParseHash(const std::string& hex);

std::vector<std::string> HashesToHex(const std::vector<Hash>& hashes);
std::vector<Hash> ParseHashes(const std::vector<std::string>& hexes);

// comma separated list, as taken on the command line
std::vector<std::string> SplitList(const std::string& list, char separator = ',');

// fixed width big-endian, so that encoded keys sort numerically
void WriteUint64BE(std::vector<uint8_t>& buf, uint64_t value);
uint64_t ReadUint64BE(const std::vector<uint8_t>& data, size_t offset);

#endif
