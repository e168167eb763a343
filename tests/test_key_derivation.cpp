#include <gtest/gtest.h>
#include "castle_key_derivation.hpp"

using namespace castle;

TEST(KeyDerivationTest, SliceAndRotate) {
    EXPECT_EQ(derive_key("abcd1234", 4, '0'), (Bytes{0xab, 0xcd}));
    EXPECT_EQ(derive_key("abcd1234", 4, '1'), (Bytes{0xbc, 0xda}));
    // 0xf = 15, 15 mod 4 = 3
    EXPECT_EQ(derive_key("abcd1234", 4, 'f'), (Bytes{0xda, 0xbc}));
    EXPECT_EQ(derive_key("0123456789abcdef", 8, '9'), (Bytes{0x12, 0x34, 0x56, 0x70}));
}

TEST(KeyDerivationTest, RotationUppercaseNibble) {
    EXPECT_EQ(derive_key("abcd", 4, 'F'), derive_key("abcd", 4, 'f'));
}

TEST(KeyDerivationTest, ShortKeyUsesWhatIsThere) {
    EXPECT_EQ(derive_key("ab", 8, '0'), (Bytes{0xab}));
    EXPECT_TRUE(derive_key("", 4, '0').empty());
}

TEST(KeyDerivationTest, XorIsCyclic) {
    Bytes data = {0x00, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(derive_and_xor("abcd", 4, '0', data), (Bytes{0xab, 0xcd, 0xab, 0xcd, 0xab}));
}

TEST(KeyDerivationTest, EmptyKeyLeavesDataUnchanged) {
    Bytes data = {1, 2, 3};
    EXPECT_EQ(derive_and_xor("", 4, '0', data), data);
}

TEST(KeyDerivationTest, TwoLayersUndoInReverse) {
    const std::string ts_key = "aaaab86aad1a";
    const std::string uuid = "0f1e2d3c4b5a69788796a5b4c3d2e1f0";
    Bytes data = text_bytes("fingerprint payload terminated by 0xff");

    Bytes pass1 = derive_and_xor(ts_key, 4, ts_key[3], data);
    Bytes pass2 = derive_and_xor(uuid, 8, uuid[9], pass1);
    EXPECT_NE(pass2, data);

    Bytes back1 = derive_and_xor(uuid, 8, uuid[9], pass2);
    EXPECT_EQ(derive_and_xor(ts_key, 4, ts_key[3], back1), data);
}

TEST(KeyDerivationTest, BadRotationNibbleThrows) {
    EXPECT_THROW(derive_key("abcd", 4, 'x'), std::invalid_argument);
}
