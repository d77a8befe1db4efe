#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "config.h"
#include "crypto.h"
#include "merkleProof.h"
#include "serialization.h"

// restores the configured digest when a test changes it
class DigestConfigTest : public ::testing::Test {
    protected:
        void TearDown() override { Config::SetDigestName(Refund::DEFAULT_DIGEST); }
};

static std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

TEST(CryptoTest, Sha3KnownVectors) {
    EXPECT_EQ(ByteArrayToHexString(DigestBytes("SHA3-256", {})),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
    EXPECT_EQ(ByteArrayToHexString(DigestBytes("SHA3-256", bytesOf("abc"))),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(CryptoTest, DefaultDigestIsSha3) {
    std::vector<uint8_t> data = bytesOf("refund");
    Hash hash = HashBytes(data);
    EXPECT_EQ(std::vector<uint8_t>(hash.begin(), hash.end()), DigestBytes("SHA3-256", data));
}

TEST(CryptoTest, SortedPairIsSymmetric) {
    Hash a = HashBytes(bytesOf("a"));
    Hash b = HashBytes(bytesOf("b"));
    EXPECT_EQ(HashSortedPair(a, b), HashSortedPair(b, a));

    const Hash& low = (a < b) ? a : b;
    const Hash& high = (a < b) ? b : a;
    std::vector<uint8_t> combined(low.begin(), low.end());
    combined.insert(combined.end(), high.begin(), high.end());
    EXPECT_EQ(HashSortedPair(a, b), HashBytes(combined));
}

TEST(CryptoTest, ZeroHash) {
    Hash zero{};
    EXPECT_TRUE(IsZeroHash(zero));
    zero[31] = 1;
    EXPECT_FALSE(IsZeroHash(zero));
}

TEST(CryptoTest, LeafEncodesAddressThenAmount) {
    Address address = ParseAddress("0x18BdaeF860d0153276cFD211E99A2F3028eA2795");
    Amount amount = Amount::ParseUnits("0.7", 18);

    std::vector<uint8_t> packed(address.begin(), address.end());
    std::vector<uint8_t> amountBytes = amount.ToBytes();
    packed.insert(packed.end(), amountBytes.begin(), amountBytes.end());
    ASSERT_EQ(packed.size(), 52u);
    EXPECT_EQ(EncodeLeaf(address, amount), HashBytes(packed));

    std::vector<uint8_t> swapped(amountBytes.begin(), amountBytes.end());
    swapped.insert(swapped.end(), address.begin(), address.end());
    EXPECT_NE(EncodeLeaf(address, amount), HashBytes(swapped));
}

TEST_F(DigestConfigTest, ConfiguredDigestChangesLeaves) {
    Address address = ParseAddress("0x18BdaeF860d0153276cFD211E99A2F3028eA2795");
    Amount amount(1);

    Hash sha3Leaf = EncodeLeaf(address, amount);
    Config::SetDigestName("SHA256");
    Hash sha2Leaf = EncodeLeaf(address, amount);

    EXPECT_NE(sha3Leaf, sha2Leaf);
    EXPECT_EQ(ByteArrayToHexString(DigestBytes("SHA256", bytesOf("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(DigestConfigTest, RejectsUnusableDigests) {
    Config::SetDigestName("SHA512");
    EXPECT_THROW(HashBytes(bytesOf("abc")), std::runtime_error);

    Config::SetDigestName("NOT-A-DIGEST");
    EXPECT_THROW(HashBytes(bytesOf("abc")), std::runtime_error);

    EXPECT_THROW(Config::SetDigestName(""), std::invalid_argument);
}
