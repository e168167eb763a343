#include <gtest/gtest.h>
#include "castle_field_encoder.hpp"
#include "castle_fingerprint.hpp"
#include "castle_xxtea.hpp"

#include <algorithm>

using namespace castle;

namespace {

// 2023-11-14T22:13:20Z, after the US DST change
constexpr double INIT_TIME = 1700000000000.0;

bool contains(const Bytes& haystack, const Bytes& needle) {
    return std::search(haystack.begin(), haystack.end(),
                       needle.begin(), needle.end()) != haystack.end();
}

} // namespace

TEST(FingerprintTest, CodecPlayability) {
    EXPECT_EQ(fingerprint::codec_playability(), (Bytes{0xA2, 0x6A}));
}

TEST(FingerprintTest, DeviceSection) {
    const auto profile = BrowserProfile::chrome_windows();
    const Bytes dev = fingerprint::build_device(INIT_TIME, profile, DEFAULT_USER_AGENT);

    ASSERT_GT(dev.size(), 7u);
    EXPECT_EQ(dev[0], 29);  // part 0, 29 fields
    // platform Win32, vendor Google
    EXPECT_EQ(Bytes(dev.begin() + 1, dev.begin() + 5), (Bytes{0x03, 1, 0x0B, 0}));
    // locale, encrypted
    EXPECT_EQ(dev[5], field_header(2, FieldEncoding::EncryptedBytes));

    // timezone: New York standard time
    EXPECT_TRUE(contains(dev, Bytes{field_header(8, FieldEncoding::RawAppend), 20, 4}));

    // user agent under field key 12
    const Bytes ua = field_encrypt(text_bytes(DEFAULT_USER_AGENT), 12, INIT_TIME);
    Bytes ua_field{field_header(12, FieldEncoding::RawAppend), 1,
                   static_cast<uint8_t>(ua.size())};
    append(ua_field, ua);
    EXPECT_TRUE(contains(dev, ua_field));

    // codec playability closes the section
    EXPECT_EQ(Bytes(dev.end() - 3, dev.end()),
              (Bytes{field_header(31, FieldEncoding::RawAppend), 0xA2, 0x6A}));
}

TEST(FingerprintTest, DeviceSectionKnownAnswer) {
    const Bytes dev = fingerprint::build_device(
        INIT_TIME, BrowserProfile::chrome_windows(), DEFAULT_USER_AGENT);
    const std::string expected =
        "1d03010b001408c8ff6fd7fabe08bf1e50278780043804082d1835183e0a4714"
        "044f027d5fc9a75705729302085f0c007f67017010cb1793dd0908f9c92756d0"
        "50d774343b7738d4544f139d34e3141c5f262ea8dc8901b4be25317d67d5b4f9"
        "ec1da9a3ce2bad045d8476adccbaebd85778dd62175981dad2750b1c59ea54d2"
        "f8e130f5453b4ec8884f986d9f1b28d841d35d813365e4db128f50f2e81479f9"
        "ba4723676c0818b1a86f0d182b927703078b009408827153a0fddabcdb9c4cc7"
        "ee880a48480298fb33e4175e9f3fd469588d3640ba122ac9b4ecd427e2d2a73c"
        "834ed1fc42e890c2456fd4657ff7d581df8acaf3eabbbf80f8a7d74368472bbd"
        "8271a5fbc44669871a0ad9a4189276546eb3d51c74ebfd95ef613fde95113171"
        "edb74580ecaf0800b521c5b105cb00d301dd9224e700eb03f75dc5abb588ffa2"
        "6a";
    EXPECT_EQ(to_hex(dev), expected);
}

TEST(FingerprintTest, DeviceSectionDependsOnUserAgent) {
    const auto profile = BrowserProfile::chrome_windows();
    EXPECT_NE(fingerprint::build_device(INIT_TIME, profile, "a"),
              fingerprint::build_device(INIT_TIME, profile, "b"));
}

TEST(FingerprintTest, BrowserSectionKnownTimezone) {
    SeededRandomSource rng(5);
    const Bytes br = fingerprint::build_browser(BrowserProfile::chrome_windows(), INIT_TIME, rng);

    EXPECT_EQ(br[0], (4 << 5) | 13);
    EXPECT_EQ(Bytes(br.begin() + 1, br.begin() + 5), (Bytes{0x03, 0, 0x0B, 0}));

    // window size difference closes the section
    ASSERT_GE(br.size(), 5u);
    EXPECT_EQ(br[br.size() - 5], field_header(24, FieldEncoding::RawAppend));
    EXPECT_EQ(br[br.size() - 4], 0);
    EXPECT_EQ(br[br.size() - 3], 0);
    EXPECT_EQ(br[br.size() - 2], 0);
    EXPECT_GE(br.back(), 10);
    EXPECT_LE(br.back(), 30);
}

TEST(FingerprintTest, BrowserSectionUnknownTimezoneIsEncrypted) {
    auto profile = BrowserProfile::chrome_windows();
    profile.timezone = "Europe/Berlin";
    SeededRandomSource rng(5);
    const Bytes br = fingerprint::build_browser(profile, INIT_TIME, rng);
    EXPECT_EQ(br[3], field_header(1, FieldEncoding::EncryptedBytes));
}

TEST(FingerprintTest, TimingSection) {
    const Bytes t = fingerprint::build_timing(INIT_TIME);
    EXPECT_EQ(t, (Bytes{(7 << 5) | 2,
                        field_header(3, FieldEncoding::CompactInt), 1,
                        field_header(4, FieldEncoding::CompactInt), 13}));
}
