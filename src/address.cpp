#include "address.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "crypto.h"
#include "refundError.h"
#include "serialization.h"

static const std::string CHECKSUM_DIGEST = "KECCAK-256";

static bool hasMixedCase(const std::string& digits) {
    bool lower =
        std::any_of(digits.begin(), digits.end(), [](char c) { return c >= 'a' && c <= 'f'; });
    bool upper =
        std::any_of(digits.begin(), digits.end(), [](char c) { return c >= 'A' && c <= 'F'; });
    return lower && upper;
}

Address ParseAddress(const std::string& text) {
    std::vector<uint8_t> bytes;
    try {
        bytes = FromPrefixedHex(text);
    } catch (const std::invalid_argument&) {
        throw RefundError(RefundErrorCode::InvalidAddress, "Invalid address: " + text);
    }

    if (bytes.size() != Refund::ADDRESS_SIZE) {
        throw RefundError(RefundErrorCode::InvalidAddress, "Invalid address: " + text);
    }

    Address address;
    std::copy(bytes.begin(), bytes.end(), address.begin());

    std::string digits = text.substr(2);
    if (Config::GetDigestName() == CHECKSUM_DIGEST && hasMixedCase(digits) &&
        ToChecksumAddress(address).substr(2) != digits) {
        throw RefundError(RefundErrorCode::InvalidAddress, "Invalid address checksum: " + text);
    }

    return address;
}

std::string AddressToString(const Address& address) {
    return ToPrefixedHex(std::vector<uint8_t>(address.begin(), address.end()));
}

std::string ToChecksumAddress(const Address& address) {
    std::string lower = AddressToString(address).substr(2);
    std::vector<uint8_t> hash =
        DigestBytes(CHECKSUM_DIGEST, std::vector<uint8_t>(lower.begin(), lower.end()));

    // a letter is uppercased when its nibble of the hash is 8 or more
    std::string result = "0x";
    for (size_t i = 0; i < lower.size(); i++) {
        uint8_t nibble = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0f);
        char c = lower[i];
        if (c >= 'a' && c <= 'f' && nibble >= 8) {
            c = static_cast<char>(c - 'a' + 'A');
        }
        result += c;
    }
    return result;
}

bool IsValidAddress(const std::string& text) {
    try {
        ParseAddress(text);
        return true;
    } catch (const RefundError&) {
        return false;
    }
}
