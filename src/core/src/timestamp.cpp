/**
 * @file timestamp.cpp
 * @brief Clamped timestamp encoding and its nibble obfuscation
 */

#include "../include/castle_timestamp.hpp"
#include "../include/castle_constants.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace castle {

namespace {

const char* HEX_DIGITS = "0123456789abcdef";

// Drop the first hex digit, XOR the rest with k, append k
std::string xor_and_append_key(const Bytes& buf, uint8_t k) {
    const std::string hex = to_hex(buf);
    std::string out;
    out.reserve(hex.size());
    for (size_t i = 1; i < hex.size(); ++i) {
        out.push_back(HEX_DIGITS[(hex_digit_value(hex[i]) ^ k) & 0xF]);
    }
    out.push_back(HEX_DIGITS[k & 0xF]);
    return out;
}

uint32_t unxor_group(const std::string& group) {
    const int k = hex_digit_value(group.back());
    uint32_t value = 0;
    for (size_t i = 0; i + 1 < group.size(); ++i) {
        const int nib = hex_digit_value(group[i]);
        if (nib < 0 || k < 0) {
            throw std::invalid_argument("invalid timestamp hex: " + group);
        }
        value = (value << 4) | static_cast<uint32_t>(nib ^ k);
    }
    return value;
}

} // namespace

Bytes encode_timestamp_bytes(double ms) {
    const double secs = std::floor(ms / 1000.0 - static_cast<double>(wire::TS_EPOCH_SECONDS));
    uint32_t t = 0;
    if (secs >= static_cast<double>(wire::TS_MAX)) {
        t = wire::TS_MAX;
    } else if (secs > 0.0) {
        t = static_cast<uint32_t>(secs);
    }
    return be32(t);
}

uint32_t millis_slice(double ms) {
    const long long f = static_cast<long long>(std::floor(ms));
    return static_cast<uint32_t>(std::llabs(f) % 1000);
}

std::string encode_timestamp_encrypted(double ms, uint8_t key_nibble) {
    const uint8_t k = key_nibble & 0xF;
    return xor_and_append_key(encode_timestamp_bytes(ms), k) +
           xor_and_append_key(be16(millis_slice(ms)), k);
}

std::string encode_timestamp_encrypted(double ms, RandomSource& rng) {
    return encode_timestamp_encrypted(ms, static_cast<uint8_t>(rng.uniform(16)));
}

DecodedTimestamp decode_timestamp_encrypted(const std::string& hex) {
    if (hex.size() != wire::ENCRYPTED_TIMESTAMP_BYTES * 2) {
        throw std::invalid_argument("encrypted timestamp must be 12 hex chars");
    }
    DecodedTimestamp out;
    out.seconds    = unxor_group(hex.substr(0, 8));
    out.millis     = unxor_group(hex.substr(8, 4));
    out.key_nibble = static_cast<uint8_t>(hex_digit_value(hex[7]));
    return out;
}

} // namespace castle
