/**
 * @file bytes.cpp
 * @brief Byte buffer helpers and libsodium hex / Base64URL codecs
 */

#include "../include/castle_bytes.hpp"

#include <sodium.h>
#include <stdexcept>

namespace castle {

void append(Bytes& dst, const Bytes& src) {
    dst.insert(dst.end(), src.begin(), src.end());
}

Bytes concat(std::initializer_list<Bytes> parts) {
    size_t total = 0;
    for (const auto& p : parts) total += p.size();

    Bytes out;
    out.reserve(total);
    for (const auto& p : parts) append(out, p);
    return out;
}

Bytes be16(uint32_t v) {
    return {static_cast<uint8_t>((v >> 8) & 0xFF),
            static_cast<uint8_t>(v & 0xFF)};
}

Bytes be32(uint32_t v) {
    return {static_cast<uint8_t>((v >> 24) & 0xFF),
            static_cast<uint8_t>((v >> 16) & 0xFF),
            static_cast<uint8_t>((v >> 8) & 0xFF),
            static_cast<uint8_t>(v & 0xFF)};
}

Bytes text_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

Bytes xor_bytes(const Bytes& data, const Bytes& key) {
    if (key.empty()) return data;
    Bytes out(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = data[i] ^ key[i % key.size()];
    }
    return out;
}

std::string to_hex(const Bytes& data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Bytes from_hex(const std::string& hex) {
    size_t even_len = hex.size() & ~static_cast<size_t>(1);
    Bytes out(even_len / 2);
    if (out.empty()) return out;

    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), even_len,
                       nullptr, &bin_len, &end) != 0 || bin_len != out.size()) {
        throw std::invalid_argument("invalid hex string: " + hex);
    }
    return out;
}

std::string base64url_encode(const Bytes& data) {
    const int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    std::string out(sodium_base64_encoded_len(data.size(), variant), '\0');
    sodium_bin2base64(&out[0], out.size(), data.data(), data.size(), variant);
    // encoded_len counts the terminating NUL
    out.resize(out.size() - 1);
    return out;
}

std::optional<Bytes> base64url_decode(const std::string& text) {
    Bytes out(text.size() * 3 / 4 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                          nullptr, &bin_len, &end,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) {
        return std::nullopt;
    }
    if (end != text.data() + text.size()) return std::nullopt;
    out.resize(bin_len);
    return out;
}

} // namespace castle
