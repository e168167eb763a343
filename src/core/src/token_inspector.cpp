/**
 * @file token_inspector.cpp
 * @brief Reverses token framing for diagnostics and tests
 */

#include "../include/castle_token_inspector.hpp"
#include "../include/castle_constants.hpp"
#include "../include/castle_error.hpp"
#include "../include/castle_key_derivation.hpp"
#include "../include/castle_xxtea.hpp"

#include <stdexcept>

namespace castle {

namespace {

// [timestamp:6][sdk:2][publisher key:32][uuid:16]
constexpr size_t PUBLISHER_KEY_BYTES = 32;
constexpr size_t HEADER_BYTES = wire::ENCRYPTED_TIMESTAMP_BYTES + 2 +
                                PUBLISHER_KEY_BYTES + wire::UUID_BYTES;

// mask + version + padding + two cipher words + checksum
constexpr size_t MIN_TOKEN_BYTES = 1 + 2 + 8 + 1;

Bytes slice(const Bytes& src, size_t from, size_t len) {
    return Bytes(src.begin() + static_cast<std::ptrdiff_t>(from),
                 src.begin() + static_cast<std::ptrdiff_t>(from + len));
}

DecodedTimestamp decode_timestamp(const Bytes& raw) {
    try {
        return decode_timestamp_encrypted(to_hex(raw));
    } catch (const std::invalid_argument& e) {
        throw TokenFormatError(e.what());
    }
}

} // namespace

TokenInfo inspect_token(const std::string& token) {
    auto decoded = base64url_decode(token);
    if (!decoded) {
        throw TokenFormatError("token is not valid Base64URL");
    }
    const Bytes& raw = *decoded;
    if (raw.size() < MIN_TOKEN_BYTES) {
        throw TokenFormatError("token too short: " + std::to_string(raw.size()) + " bytes");
    }

    // Outer mask
    const Bytes framed = xor_bytes(slice(raw, 1, raw.size() - 1), Bytes{raw[0]});

    const uint8_t checksum = framed.back();
    const auto expected = static_cast<uint8_t>(((framed.size() - 1) * 2) & 0xFF);
    if (checksum != expected) {
        throw TokenFormatError("checksum mismatch");
    }

    TokenInfo info;
    info.version = framed[0];
    info.padding = framed[1];
    if (info.version != wire::TOKEN_VERSION) {
        throw TokenFormatError("unsupported token version " + std::to_string(info.version));
    }

    const Bytes encrypted = slice(framed, 2, framed.size() - 3);
    if (encrypted.size() % 4 != 0 || info.padding > 3) {
        throw TokenFormatError("ciphertext is not word aligned");
    }

    Bytes plaintext = XXTEA::decrypt(encrypted, wire::TOKEN_KEY);
    plaintext.resize(plaintext.size() - info.padding);
    if (plaintext.size() < HEADER_BYTES + wire::ENCRYPTED_TIMESTAMP_BYTES) {
        throw TokenFormatError("payload shorter than header");
    }

    // Header
    size_t off = 0;
    info.init_time = decode_timestamp(slice(plaintext, off, wire::ENCRYPTED_TIMESTAMP_BYTES));
    off += wire::ENCRYPTED_TIMESTAMP_BYTES;
    info.sdk_version = static_cast<uint16_t>((plaintext[off] << 8) | plaintext[off + 1]);
    off += 2;
    const Bytes pk = slice(plaintext, off, PUBLISHER_KEY_BYTES);
    info.publisher_key.assign(pk.begin(), pk.end());
    off += PUBLISHER_KEY_BYTES;
    info.cuid = to_hex(slice(plaintext, off, wire::UUID_BYTES));
    off += wire::UUID_BYTES;

    // XOR layer 2, then layer 1
    const Bytes pass2 = slice(plaintext, off, plaintext.size() - off);
    const Bytes with_prefix = derive_and_xor(info.cuid, wire::UUID_KEY_SLICE,
                                             info.cuid[wire::UUID_ROTATE_INDEX], pass2);

    const Bytes send_raw = slice(with_prefix, 0, wire::ENCRYPTED_TIMESTAMP_BYTES);
    info.send_time = decode_timestamp(send_raw);

    const std::string timestamp_key = to_hex(send_raw);
    info.fingerprint = derive_and_xor(
        timestamp_key, wire::TIMESTAMP_KEY_SLICE,
        timestamp_key[wire::TIMESTAMP_ROTATE_INDEX],
        slice(with_prefix, wire::ENCRYPTED_TIMESTAMP_BYTES,
              with_prefix.size() - wire::ENCRYPTED_TIMESTAMP_BYTES));

    return info;
}

} // namespace castle
