#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "address.h"
#include "config.h"
#include "crypto.h"
#include "refundError.h"
#include "serialization.h"

TEST(SerializationTest, HexRoundTrip) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(ByteArrayToHexString(bytes), "000fabff");
    EXPECT_EQ(HexStringToByteArray("000FABff"), bytes);
    EXPECT_EQ(ToPrefixedHex(bytes), "0x000fabff");
    EXPECT_EQ(FromPrefixedHex("0x000fabff"), bytes);
}

TEST(SerializationTest, HexParsingIsStrict) {
    EXPECT_THROW(HexStringToByteArray("abc"), std::invalid_argument);
    EXPECT_THROW(HexStringToByteArray("zz"), std::invalid_argument);
    EXPECT_THROW(HexStringToByteArray("0x12"), std::invalid_argument);
    EXPECT_THROW(FromPrefixedHex("1234"), std::invalid_argument);
    EXPECT_TRUE(FromPrefixedHex("0x").empty());
}

TEST(SerializationTest, ParseHashRequiresThirtyTwoBytes) {
    std::string hex = "0x" + std::string(64, 'a');
    Hash hash = ParseHash(hex);
    EXPECT_EQ(hash[0], 0xaa);
    EXPECT_EQ(HashToHex(hash), hex);

    try {
        ParseHash("0x" + std::string(62, 'a'));
        FAIL() << "short hash accepted";
    } catch (const RefundError& e) {
        EXPECT_EQ(e.GetCode(), RefundErrorCode::InvalidHash);
        EXPECT_EQ(e.GetCategory(), ErrorCategory::InvalidInput);
    }

    EXPECT_THROW(ParseHash(std::string(64, 'a')), RefundError);
    EXPECT_THROW(ParseHash("0x" + std::string(63, 'a') + "g"), RefundError);
}

TEST(SerializationTest, SplitList) {
    std::vector<std::string> expected = {"0x01", "0x02", "0x03"};
    EXPECT_EQ(SplitList("0x01,0x02,0x03"), expected);
    EXPECT_EQ(SplitList("0x01,,0x02,0x03,"), expected);
    EXPECT_TRUE(SplitList("").empty());
}

TEST(SerializationTest, Uint64IsBigEndian) {
    std::vector<uint8_t> buf;
    WriteUint64BE(buf, 0x0102030405060708ULL);
    std::vector<uint8_t> expected = {1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(buf, expected);
    EXPECT_EQ(ReadUint64BE(buf, 0), 0x0102030405060708ULL);
    EXPECT_THROW(ReadUint64BE(buf, 1), std::runtime_error);
}

TEST(AddressTest, ParseAcceptsAnyCaseAndPrintsLowercase) {
    Address address = ParseAddress("0xF525E7409441743Dc77B5BaacF4755f4cc33400b");
    EXPECT_EQ(address[0], 0xf5);
    EXPECT_EQ(address[19], 0x0b);
    EXPECT_EQ(AddressToString(address), "0xf525e7409441743dc77b5baacf4755f4cc33400b");
    EXPECT_EQ(ParseAddress("0xf525e7409441743dc77b5baacf4755f4cc33400b"), address);
}

TEST(AddressTest, RejectsMalformedAddresses) {
    EXPECT_FALSE(IsValidAddress(""));
    EXPECT_FALSE(IsValidAddress("0x"));
    EXPECT_FALSE(IsValidAddress("F525E7409441743Dc77B5BaacF4755f4cc33400b"));
    EXPECT_FALSE(IsValidAddress("0xF525E7409441743Dc77B5BaacF4755f4cc3340"));
    EXPECT_FALSE(IsValidAddress("0xF525E7409441743Dc77B5BaacF4755f4cc33400b00"));
    EXPECT_FALSE(IsValidAddress("0xG525E7409441743Dc77B5BaacF4755f4cc33400b"));
    EXPECT_TRUE(IsValidAddress("0x54859974A781e80a8D7353F4291B39b4988F8036"));

    try {
        ParseAddress("0x1234");
        FAIL() << "short address accepted";
    } catch (const RefundError& e) {
        EXPECT_EQ(e.GetCode(), RefundErrorCode::InvalidAddress);
    }
}

TEST(AddressTest, BadChecksumIsAcceptedWithoutKeccak) {
    ASSERT_NE(Config::GetDigestName(), "KECCAK-256");
    EXPECT_TRUE(IsValidAddress("0x5aaeb6053F3E94C9b9A09f33669435E7Ef1BeAed"));
}

class AddressChecksumTest : public ::testing::Test {
    protected:
        void SetUp() override {
            try {
                DigestBytes("KECCAK-256", {});
            } catch (const std::runtime_error&) {
                GTEST_SKIP() << "KECCAK-256 needs OpenSSL 3.2 or later";
            }
            Config::SetDigestName("KECCAK-256");
        }

        void TearDown() override { Config::SetDigestName(Refund::DEFAULT_DIGEST); }
};

TEST_F(AddressChecksumTest, KnownChecksums) {
    const std::vector<std::string> addresses = {
        "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed",
        "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359",
        "0xdbF03B407c01E7cD3CBea99509d93f8DDDC8C6FB",
        "0xD1220A0cf47c7B9Be7A2E6BA89F429762e7b9aDb",
    };

    for (const std::string& text : addresses) {
        Address address = ParseAddress(text);
        EXPECT_EQ(ToChecksumAddress(address), text);
    }
}

TEST_F(AddressChecksumTest, MixedCaseMustMatchTheChecksum) {
    try {
        ParseAddress("0x5aaeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
        FAIL() << "bad checksum accepted";
    } catch (const RefundError& e) {
        EXPECT_EQ(e.GetCode(), RefundErrorCode::InvalidAddress);
    }

    // single case carries no checksum
    EXPECT_TRUE(IsValidAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"));
    EXPECT_TRUE(IsValidAddress("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED"));
}
