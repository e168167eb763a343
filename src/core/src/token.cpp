/**
 * @file token.cpp
 * @brief TokenGenerator implementation
 */

#include "../include/castle_token.hpp"
#include "../include/castle_behavior.hpp"
#include "../include/castle_constants.hpp"
#include "../include/castle_fingerprint.hpp"
#include "../include/castle_key_derivation.hpp"
#include "../include/castle_logger.hpp"
#include "../include/castle_timestamp.hpp"
#include "../include/castle_xxtea.hpp"

#include <chrono>

namespace castle {

namespace {

// The page is assumed to have loaded 2-30 minutes before the login submit
constexpr double MIN_PAGE_AGE_MS = 2.0 * 60 * 1000;
constexpr double MAX_PAGE_AGE_MS = 30.0 * 60 * 1000;

} // namespace

int64_t system_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

TokenGenerator::TokenGenerator(RandomSource& rng, Clock clock)
    : rng_(rng)
    , clock_(std::move(clock))
{}

Bytes TokenGenerator::build_header(const std::string& uuid_hex, double init_time) {
    return concat({
        from_hex(encode_timestamp_encrypted(init_time, rng_)),
        be16(wire::SDK_VERSION),
        text_bytes(wire::PUBLISHER_KEY),
        from_hex(uuid_hex),
    });
}

Bytes TokenGenerator::build_fingerprint(double init_time, const BrowserProfile& profile,
                                        const std::string& user_agent) {
    return concat({
        fingerprint::build_device(init_time, profile, user_agent),
        fingerprint::build_browser(profile, init_time, rng_),
        fingerprint::build_timing(init_time),
        behavior::generate_event_log(rng_),
        behavior::build_behavioral_data(rng_),
        Bytes{wire::FINGERPRINT_TERMINATOR},
    });
}

Bytes TokenGenerator::seal(const Bytes& plaintext) {
    const Bytes encrypted = XXTEA::encrypt(plaintext, wire::TOKEN_KEY);
    const auto padding = static_cast<uint8_t>(encrypted.size() - plaintext.size());

    Bytes framed = concat({Bytes{wire::TOKEN_VERSION, padding}, encrypted});
    framed.push_back(static_cast<uint8_t>((framed.size() * 2) & 0xFF));

    const uint8_t mask = rng_.byte();
    return concat({Bytes{mask}, xor_bytes(framed, Bytes{mask})});
}

CastleToken TokenGenerator::generate(const std::string& user_agent,
                                     const BrowserProfile& profile) {
    const int64_t now = clock_();
    const double init_time = static_cast<double>(now) -
                             rng_.uniform_double(MIN_PAGE_AGE_MS, MAX_PAGE_AGE_MS);

    CASTLE_LOG_DEBUG("Generating v11 fingerprint token");

    const Bytes fingerprint_data = build_fingerprint(init_time, profile, user_agent);

    // Layer 1: key from the obfuscated send timestamp
    const std::string timestamp_key =
        encode_timestamp_encrypted(static_cast<double>(clock_()), rng_);
    const Bytes pass1 = derive_and_xor(timestamp_key, wire::TIMESTAMP_KEY_SLICE,
                                       timestamp_key[wire::TIMESTAMP_ROTATE_INDEX],
                                       fingerprint_data);

    // Layer 2: key from a fresh UUID, over [send timestamp][pass1]
    const std::string uuid = to_hex(rng_.bytes(wire::UUID_BYTES));
    const Bytes pass2 = derive_and_xor(uuid, wire::UUID_KEY_SLICE,
                                       uuid[wire::UUID_ROTATE_INDEX],
                                       concat({from_hex(timestamp_key), pass1}));

    const Bytes plaintext = concat({build_header(uuid, init_time), pass2});

    CastleToken result;
    result.token = base64url_encode(seal(plaintext));
    result.cuid = uuid;

    CASTLE_LOG_DEBUG("Generated token: " + std::to_string(result.token.size()) +
                     " chars, cuid: " + result.cuid);
    return result;
}

CastleToken generate_token(const std::string& user_agent) {
    TokenGenerator generator(CSPRNG::default_source());
    return generator.generate(user_agent);
}

} // namespace castle
