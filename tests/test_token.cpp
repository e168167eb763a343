/**
 * @file test_token.cpp
 * @brief End-to-end tests for token generation and inspection
 */

#include <gtest/gtest.h>
#include "castle_constants.hpp"
#include "castle_error.hpp"
#include "castle_token.hpp"
#include "castle_token_inspector.hpp"

#include <regex>
#include <set>
#include <thread>
#include <vector>

using namespace castle;

namespace {

// 2023-11-14T22:13:20.123Z
constexpr int64_t FIXED_NOW_MS = 1700000000123LL;
constexpr uint32_t FIXED_NOW_TS =
    static_cast<uint32_t>(1700000000LL - wire::TS_EPOCH_SECONDS);

int64_t fixed_clock() { return FIXED_NOW_MS; }

CastleToken seeded_token(uint64_t seed) {
    SeededRandomSource rng(seed);
    TokenGenerator gen(rng, fixed_clock);
    return gen.generate(DEFAULT_USER_AGENT);
}

} // namespace

// ─── shape ───────────────────────────────────────────────────────────────────

TEST(TokenTest, ShapeOfGeneratedToken) {
    const CastleToken t = generate_token(DEFAULT_USER_AGENT);

    EXPECT_TRUE(std::regex_match(t.token, std::regex("^[A-Za-z0-9_-]+$")));
    EXPECT_GE(t.token.size(), 500u);
    EXPECT_LE(t.token.size(), 2000u);
    EXPECT_TRUE(std::regex_match(t.cuid, std::regex("^[0-9a-f]{32}$")));
}

TEST(TokenTest, EveryCallIsFresh) {
    std::set<std::string> tokens;
    std::set<std::string> cuids;
    for (int i = 0; i < 10; ++i) {
        const CastleToken t = generate_token(DEFAULT_USER_AGENT);
        tokens.insert(t.token);
        cuids.insert(t.cuid);
    }
    EXPECT_EQ(tokens.size(), 10u);
    EXPECT_EQ(cuids.size(), 10u);
}

TEST(TokenTest, EmptyUserAgentStillProducesToken) {
    SeededRandomSource rng(11);
    TokenGenerator gen(rng, fixed_clock);
    const CastleToken t = gen.generate("");
    EXPECT_FALSE(t.token.empty());
    EXPECT_NO_THROW(inspect_token(t.token));
}

TEST(TokenTest, SameSeedAndClockReproduce) {
    const CastleToken a = seeded_token(42);
    const CastleToken b = seeded_token(42);
    EXPECT_EQ(a.token, b.token);
    EXPECT_EQ(a.cuid, b.cuid);

    EXPECT_NE(seeded_token(43).token, a.token);
}

TEST(TokenTest, ConcurrentGeneration) {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 5;
    std::vector<std::vector<std::string>> results(THREADS);
    std::vector<std::thread> workers;

    for (int i = 0; i < THREADS; ++i) {
        workers.emplace_back([i, &results] {
            for (int j = 0; j < PER_THREAD; ++j) {
                results[i].push_back(generate_token(DEFAULT_USER_AGENT).cuid);
            }
        });
    }
    for (auto& w : workers) w.join();

    std::set<std::string> all;
    for (const auto& r : results) all.insert(r.begin(), r.end());
    EXPECT_EQ(all.size(), static_cast<size_t>(THREADS * PER_THREAD));
}

// ─── inspection ──────────────────────────────────────────────────────────────

TEST(TokenInspectorTest, RoundTripHeader) {
    const CastleToken t = seeded_token(7);
    const TokenInfo info = inspect_token(t.token);

    EXPECT_EQ(info.version, wire::TOKEN_VERSION);
    EXPECT_LE(info.padding, 3);
    EXPECT_EQ(info.sdk_version, wire::SDK_VERSION);
    EXPECT_EQ(info.publisher_key, wire::PUBLISHER_KEY);
    EXPECT_EQ(info.cuid, t.cuid);
}

TEST(TokenInspectorTest, RoundTripTimestamps) {
    const TokenInfo info = inspect_token(seeded_token(8).token);

    EXPECT_EQ(info.send_time.seconds, FIXED_NOW_TS);
    EXPECT_EQ(info.send_time.millis, 123u);

    // page loaded 2 to 30 minutes before the send
    EXPECT_GE(info.init_time.seconds, FIXED_NOW_TS - 30 * 60 - 1);
    EXPECT_LE(info.init_time.seconds, FIXED_NOW_TS - 2 * 60);
}

TEST(TokenInspectorTest, RoundTripFingerprint) {
    SeededRandomSource rng(9);
    TokenGenerator gen(rng, fixed_clock);
    const TokenInfo info = inspect_token(gen.generate(DEFAULT_USER_AGENT).token);

    ASSERT_FALSE(info.fingerprint.empty());
    EXPECT_EQ(info.fingerprint.front(), 29);  // device section header
    EXPECT_EQ(info.fingerprint.back(), wire::FINGERPRINT_TERMINATOR);
}

TEST(TokenInspectorTest, SealFraming) {
    SeededRandomSource rng(1);
    TokenGenerator gen(rng, fixed_clock);
    const Bytes plaintext(10, 0xAB);
    const Bytes sealed = gen.seal(plaintext);

    // mask + [version][pad][12 cipher bytes][checksum]
    ASSERT_EQ(sealed.size(), 1u + 2 + 12 + 1);
    const uint8_t mask = sealed[0];
    EXPECT_EQ(sealed[1] ^ mask, wire::TOKEN_VERSION);
    EXPECT_EQ(sealed[2] ^ mask, 2);
    EXPECT_EQ(sealed.back() ^ mask, (14 * 2) & 0xFF);
}

TEST(TokenInspectorTest, RejectsInvalidBase64) {
    EXPECT_THROW(inspect_token("not base64!"), TokenFormatError);
}

TEST(TokenInspectorTest, RejectsShortToken) {
    EXPECT_THROW(inspect_token(base64url_encode(Bytes(8, 0))), TokenFormatError);
}

TEST(TokenInspectorTest, RejectsBadChecksum) {
    auto raw = base64url_decode(seeded_token(3).token);
    ASSERT_TRUE(raw.has_value());
    raw->back() ^= 0x01;
    EXPECT_THROW(inspect_token(base64url_encode(*raw)), TokenFormatError);
}

TEST(TokenInspectorTest, RejectsWrongVersion) {
    auto raw = base64url_decode(seeded_token(4).token);
    ASSERT_TRUE(raw.has_value());
    (*raw)[1] ^= 0x01;
    EXPECT_THROW(inspect_token(base64url_encode(*raw)), TokenFormatError);
}
