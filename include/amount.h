#ifndef AMOUNT_H
#define AMOUNT_H

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "config.h"

// unsigned 256-bit quantity of the native currency in its smallest unit
class Amount {
    private:
        std::array<uint8_t, Refund::AMOUNT_SIZE> value{};  // big-endian

    public:
        Amount() = default;
        explicit Amount(uint64_t units);

        // up to 32 big-endian bytes
        static Amount FromBytes(const std::vector<uint8_t>& bigEndian);

        // integer in smallest units, e.g. "1000000000000000000"
        static Amount FromString(const std::string& units);

        // decimal string scaled by 10^decimals, excess fraction digits are truncated
        static Amount ParseUnits(const std::string& decimal, uint32_t decimals);

        std::string ToString() const;
        std::string FormatUnits(uint32_t decimals) const;

        // 32 big-endian bytes, the leaf encoding of the amount
        std::vector<uint8_t> ToBytes() const;

        bool IsZero() const;

        // throw RefundError(AmountOverflow) / RefundError(InsufficientFunds)
        Amount operator+(const Amount& other) const;
        Amount operator-(const Amount& other) const;
        Amount& operator+=(const Amount& other);
        Amount& operator-=(const Amount& other);

        bool operator==(const Amount& other) const { return value == other.value; }
        bool operator!=(const Amount& other) const { return value != other.value; }
        bool operator<(const Amount& other) const { return value < other.value; }
        bool operator<=(const Amount& other) const { return value <= other.value; }
        bool operator>(const Amount& other) const { return value > other.value; }
        bool operator>=(const Amount& other) const { return value >= other.value; }
};

#endif
