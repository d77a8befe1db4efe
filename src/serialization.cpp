#include "serialization.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "refundError.h"

static int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool hasHexPrefix(const std::string& hex) {
    return hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X');
}

std::string ByteArrayToHexString(const std::vector<uint8_t>& bytes) {
    std::ostringstream ss;
    for (uint8_t b : bytes) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

std::vector<uint8_t> HexStringToByteArray(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Hex string has odd length: " + hex);
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexDigitValue(hex[i]);
        int lo = hexDigitValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex digit in: " + hex);
        }
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

std::string ToPrefixedHex(const std::vector<uint8_t>& bytes) {
    return "0x" + ByteArrayToHexString(bytes);
}

std::vector<uint8_t> FromPrefixedHex(const std::string& hex) {
    if (!hasHexPrefix(hex)) {
        throw std::invalid_argument("Hex string must start with 0x: " + hex);
    }
    return HexStringToByteArray(hex.substr(2));
}

std::string HashToHex(const Hash& hash) {
    return ToPrefixedHex(std::vector<uint8_t>(hash.begin(), hash.end()));
}

Hash ParseHash(const std::string& hex) {
    std::vector<uint8_t> bytes;
    try {
        bytes = FromPrefixedHex(hex);
    } catch (const std::invalid_argument& e) {
        throw RefundError(RefundErrorCode::InvalidHash, std::string("Invalid hash: ") + e.what());
    }

    if (bytes.size() != Refund::HASH_SIZE) {
        throw RefundError(RefundErrorCode::InvalidHash,
                          "Invalid hash: expected " + std::to_string(Refund::HASH_SIZE) +
                              " bytes, got " + std::to_string(bytes.size()));
    }

    Hash hash;
    std::copy(bytes.begin(), bytes.end(), hash.begin());
    return hash;
}

std::vector<std::string> HashesToHex(const std::vector<Hash>& hashes) {
    std::vector<std::string> hexes;
    hexes.reserve(hashes.size());
    for (const Hash& hash : hashes) {
        hexes.push_back(HashToHex(hash));
    }
    return hexes;
}

std::vector<Hash> ParseHashes(const std::vector<std::string>& hexes) {
    std::vector<Hash> hashes;
    hashes.reserve(hexes.size());
    for (const std::string& hex : hexes) {
        hashes.push_back(ParseHash(hex));
    }
    return hashes;
}

std::vector<std::string> SplitList(const std::string& list, char separator) {
    std::vector<std::string> items;
    if (list.empty()) {
        return items;
    }

    std::string item;
    std::istringstream ss(list);
    while (std::getline(ss, item, separator)) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void WriteUint64BE(std::vector<uint8_t>& buf, uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        buf.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

uint64_t ReadUint64BE(const std::vector<uint8_t>& data, size_t offset) {
    if (offset + 8 > data.size()) {
        throw std::runtime_error("Data truncated: expected 8 bytes at offset " +
                                 std::to_string(offset));
    }
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | data[offset + i];
    }
    return value;
}
