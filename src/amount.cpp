#include "amount.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

#include "refundError.h"

// RAII type alias for BIGNUM
using BN_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

static BN_ptr toBignum(const std::array<uint8_t, Refund::AMOUNT_SIZE>& value) {
    BN_ptr bn(BN_bin2bn(value.data(), static_cast<int>(value.size()), nullptr), BN_free);
    if (!bn) {
        throw std::runtime_error("Failed to allocate BIGNUM");
    }
    return bn;
}

static bool allDigits(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

Amount::Amount(uint64_t units) {
    for (size_t i = 0; i < 8; i++) {
        value[value.size() - 1 - i] = static_cast<uint8_t>((units >> (8 * i)) & 0xFF);
    }
}

Amount Amount::FromBytes(const std::vector<uint8_t>& bigEndian) {
    // leading zero bytes beyond the width are tolerated
    size_t start = 0;
    while (bigEndian.size() - start > Refund::AMOUNT_SIZE && bigEndian[start] == 0) {
        start++;
    }
    if (bigEndian.size() - start > Refund::AMOUNT_SIZE) {
        throw RefundError(RefundErrorCode::AmountOverflow);
    }

    Amount amount;
    std::copy(bigEndian.begin() + start, bigEndian.end(),
              amount.value.end() - (bigEndian.size() - start));
    return amount;
}

Amount Amount::FromString(const std::string& units) {
    if (units.empty() || !allDigits(units)) {
        throw RefundError(RefundErrorCode::InvalidAmountFormat,
                          "Invalid amount format: '" + units + "'");
    }

    BIGNUM* raw = nullptr;
    if (BN_dec2bn(&raw, units.c_str()) == 0) {
        throw std::runtime_error("BN_dec2bn failed for: " + units);
    }
    BN_ptr bn(raw, BN_free);

    Amount amount;
    if (BN_bn2binpad(bn.get(), amount.value.data(), static_cast<int>(amount.value.size())) < 0) {
        throw RefundError(RefundErrorCode::AmountOverflow,
                          "Amount does not fit in 256 bits: " + units);
    }
    return amount;
}

Amount Amount::ParseUnits(const std::string& decimal, uint32_t decimals) {
    if (decimals > Refund::MAX_DECIMALS) {
        throw RefundError(RefundErrorCode::InvalidAmountFormat,
                          "Unsupported decimal scale: " + std::to_string(decimals));
    }

    size_t dot = decimal.find('.');
    std::string integerPart = decimal.substr(0, dot);
    std::string fractionPart = (dot == std::string::npos) ? "" : decimal.substr(dot + 1);

    if ((integerPart.empty() && fractionPart.empty()) || !allDigits(integerPart) ||
        !allDigits(fractionPart)) {
        throw RefundError(RefundErrorCode::InvalidAmountFormat,
                          "Invalid amount format: '" + decimal + "'");
    }

    // truncate, never round
    if (fractionPart.size() > decimals) {
        fractionPart.resize(decimals);
    } else {
        fractionPart.append(decimals - fractionPart.size(), '0');
    }

    std::string digits = integerPart + fractionPart;
    size_t firstNonZero = digits.find_first_not_of('0');
    digits = (firstNonZero == std::string::npos) ? "0" : digits.substr(firstNonZero);

    return FromString(digits);
}

std::string Amount::ToString() const {
    BN_ptr bn = toBignum(value);

    char* raw = BN_bn2dec(bn.get());
    if (!raw) {
        throw std::runtime_error("BN_bn2dec failed");
    }
    std::string result(raw);
    OPENSSL_free(raw);
    return result;
}

std::string Amount::FormatUnits(uint32_t decimals) const {
    std::string digits = ToString();
    if (decimals == 0) {
        return digits;
    }

    if (digits.size() <= decimals) {
        digits.insert(0, decimals + 1 - digits.size(), '0');
    }

    std::string integerPart = digits.substr(0, digits.size() - decimals);
    std::string fractionPart = digits.substr(digits.size() - decimals);

    size_t lastNonZero = fractionPart.find_last_not_of('0');
    fractionPart = (lastNonZero == std::string::npos) ? "0" : fractionPart.substr(0, lastNonZero + 1);

    return integerPart + "." + fractionPart;
}

std::vector<uint8_t> Amount::ToBytes() const { return {value.begin(), value.end()}; }

bool Amount::IsZero() const {
    return std::all_of(value.begin(), value.end(), [](uint8_t b) { return b == 0; });
}

Amount Amount::operator+(const Amount& other) const {
    BN_ptr a = toBignum(value);
    BN_ptr b = toBignum(other.value);
    BN_ptr sum(BN_new(), BN_free);
    if (!sum || BN_add(sum.get(), a.get(), b.get()) != 1) {
        throw std::runtime_error("BN_add failed");
    }

    Amount result;
    if (BN_bn2binpad(sum.get(), result.value.data(), static_cast<int>(result.value.size())) < 0) {
        throw RefundError(RefundErrorCode::AmountOverflow);
    }
    return result;
}

Amount Amount::operator-(const Amount& other) const {
    if (*this < other) {
        throw RefundError(RefundErrorCode::InsufficientFunds);
    }

    BN_ptr a = toBignum(value);
    BN_ptr b = toBignum(other.value);
    BN_ptr diff(BN_new(), BN_free);
    if (!diff || BN_sub(diff.get(), a.get(), b.get()) != 1) {
        throw std::runtime_error("BN_sub failed");
    }

    Amount result;
    if (BN_bn2binpad(diff.get(), result.value.data(), static_cast<int>(result.value.size())) < 0) {
        throw std::runtime_error("BN_bn2binpad failed");
    }
    return result;
}

Amount& Amount::operator+=(const Amount& other) {
    *this = *this + other;
    return *this;
}

Amount& Amount::operator-=(const Amount& other) {
    *this = *this - other;
    return *this;
}
