#include "crypto.h"

#include <openssl/evp.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

static std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> makeCtx() {
    auto ctx =
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("Failed to allocate EVP_MD_CTX");
    return ctx;
}

static std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)> fetchDigest(const std::string& algorithm) {
    auto md = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>(
        EVP_MD_fetch(nullptr, algorithm.c_str(), nullptr), EVP_MD_free);
    if (!md) throw std::runtime_error("Digest algorithm not available: " + algorithm);
    return md;
}

std::vector<uint8_t> DigestBytes(const std::string& algorithm, const std::vector<uint8_t>& data) {
    auto md = fetchDigest(algorithm);
    auto ctx = makeCtx();

    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) <= 0 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) <= 0 ||
        EVP_DigestFinal_ex(ctx.get(), buf, &len) <= 0) {
        throw std::runtime_error("EVP digest operation failed");
    }

    return {buf, buf + len};
}

Hash HashBytes(const std::string& algorithm, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> digest = DigestBytes(algorithm, data);
    if (digest.size() != Refund::HASH_SIZE) {
        throw std::runtime_error("Digest " + algorithm + " produces " +
                                 std::to_string(digest.size()) + " bytes, expected " +
                                 std::to_string(Refund::HASH_SIZE));
    }

    Hash hash;
    std::copy(digest.begin(), digest.end(), hash.begin());
    return hash;
}

Hash HashBytes(const std::vector<uint8_t>& data) {
    return HashBytes(Config::GetDigestName(), data);
}

Hash HashSortedPair(const std::string& algorithm, const Hash& a, const Hash& b) {
    const Hash& first = (b < a) ? b : a;
    const Hash& second = (b < a) ? a : b;

    std::vector<uint8_t> combined;
    combined.reserve(first.size() + second.size());
    combined.insert(combined.end(), first.begin(), first.end());
    combined.insert(combined.end(), second.begin(), second.end());
    return HashBytes(algorithm, combined);
}

Hash HashSortedPair(const Hash& a, const Hash& b) {
    return HashSortedPair(Config::GetDigestName(), a, b);
}

bool IsZeroHash(const Hash& hash) {
    return std::all_of(hash.begin(), hash.end(), [](uint8_t b) { return b == 0; });
}
