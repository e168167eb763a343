#include <gtest/gtest.h>
#include "castle_constants.hpp"
#include "castle_timestamp.hpp"

#include <regex>

using namespace castle;

namespace {

constexpr double EPOCH_MS = static_cast<double>(wire::TS_EPOCH_SECONDS) * 1000.0;

} // namespace

TEST(TimestampTest, SecondsSinceEpoch) {
    EXPECT_EQ(encode_timestamp_bytes(EPOCH_MS + 100 * 1000.0), (Bytes{0, 0, 0, 100}));
    EXPECT_EQ(encode_timestamp_bytes(EPOCH_MS + 100 * 1000.0 + 999), (Bytes{0, 0, 0, 100}));
}

TEST(TimestampTest, ClampsBeforeEpoch) {
    EXPECT_EQ(encode_timestamp_bytes(0), (Bytes{0, 0, 0, 0}));
    EXPECT_EQ(encode_timestamp_bytes(EPOCH_MS - 5000), (Bytes{0, 0, 0, 0}));
}

TEST(TimestampTest, ClampsFarFuture) {
    EXPECT_EQ(encode_timestamp_bytes(1e16), (Bytes{0x0F, 0xFF, 0xFF, 0xFF}));
}

TEST(TimestampTest, MillisSlice) {
    EXPECT_EQ(millis_slice(1700000000123.0), 123u);
    EXPECT_EQ(millis_slice(1700000000123.9), 123u);
    EXPECT_EQ(millis_slice(7.0), 7u);
}

TEST(TimestampTest, EncryptedLayout) {
    // seconds = 0x0000012C (300), slice = 0x007B (123), key = 0xA
    const double ms = EPOCH_MS + 300 * 1000.0 + 123;
    const std::string hex = encode_timestamp_encrypted(ms, 0xA);

    ASSERT_EQ(hex.size(), 12u);
    // "0000012c" -> drop first -> "000012c" ^ a -> "aaaab86", + "a"
    EXPECT_EQ(hex.substr(0, 8), "aaaab86a");
    // "007b" -> "07b" ^ a -> "ad1", + "a"
    EXPECT_EQ(hex.substr(8, 4), "ad1a");
}

TEST(TimestampTest, LastNibbleIsKey) {
    SeededRandomSource rng(7);
    for (int i = 0; i < 32; ++i) {
        const std::string hex = encode_timestamp_encrypted(1700000000000.0 + i, rng);
        ASSERT_EQ(hex.size(), 12u);
        EXPECT_TRUE(std::regex_match(hex, std::regex("[0-9a-f]{12}")));
        EXPECT_EQ(hex[7], hex[11]);
    }
}

TEST(TimestampTest, DecodeRecoversFields) {
    const double ms = 1700000000456.0;
    for (uint8_t k = 0; k < 16; ++k) {
        const DecodedTimestamp d = decode_timestamp_encrypted(encode_timestamp_encrypted(ms, k));
        EXPECT_EQ(d.seconds, static_cast<uint32_t>(1700000000 - wire::TS_EPOCH_SECONDS));
        EXPECT_EQ(d.millis, 456u);
        EXPECT_EQ(d.key_nibble, k);
    }
}

TEST(TimestampTest, DecodeRejectsBadInput) {
    EXPECT_THROW(decode_timestamp_encrypted("abc"), std::invalid_argument);
    EXPECT_THROW(decode_timestamp_encrypted("zzzzzzzzzzzz"), std::invalid_argument);
}
