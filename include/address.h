#ifndef ADDRESS_H
#define ADDRESS_H

#include <array>
#include <cstdint>
#include <string>

#include "config.h"

// 20 byte account identifier
using Address = std::array<uint8_t, Refund::ADDRESS_SIZE>;

// accepts 0x + 40 hex digits, throws RefundError(InvalidAddress) otherwise.
// All-lower and all-upper digits are always accepted. Mixed case must be a valid
// EIP-55 checksum when the configured digest is KECCAK-256.
Address ParseAddress(const std::string& text);

// lowercase 0x form
std::string AddressToString(const Address& address);

// EIP-55 mixed-case form, needs KECCAK-256 from OpenSSL
std::string ToChecksumAddress(const Address& address);

bool IsValidAddress(const std::string& text);

#endif
