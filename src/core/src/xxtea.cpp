/**
 * @file xxtea.cpp
 * @brief XXTEA block cipher, whole-buffer and per-field
 */

#include "../include/castle_xxtea.hpp"
#include "../include/castle_constants.hpp"

#include <cmath>
#include <stdexcept>

namespace castle {

namespace {

std::vector<uint32_t> to_words(const Bytes& padded) {
    std::vector<uint32_t> v(padded.size() / 4);
    for (size_t i = 0; i < v.size(); ++i) {
        v[i] =  static_cast<uint32_t>(padded[i * 4]) |
               (static_cast<uint32_t>(padded[i * 4 + 1]) << 8) |
               (static_cast<uint32_t>(padded[i * 4 + 2]) << 16) |
               (static_cast<uint32_t>(padded[i * 4 + 3]) << 24);
    }
    return v;
}

Bytes from_words(const std::vector<uint32_t>& v) {
    Bytes out(v.size() * 4);
    for (size_t i = 0; i < v.size(); ++i) {
        out[i * 4]     = static_cast<uint8_t>(v[i] & 0xFF);
        out[i * 4 + 1] = static_cast<uint8_t>((v[i] >> 8) & 0xFF);
        out[i * 4 + 2] = static_cast<uint8_t>((v[i] >> 16) & 0xFF);
        out[i * 4 + 3] = static_cast<uint8_t>((v[i] >> 24) & 0xFF);
    }
    return out;
}

inline uint32_t mx(uint32_t sum, uint32_t y, uint32_t z, size_t p,
                   uint32_t e, const uint32_t* key) {
    return (((z >> 5) ^ (y << 2)) + ((y >> 3) ^ (z << 4))) ^
           ((sum ^ y) + (key[(p & 3) ^ e] ^ z));
}

} // namespace

Bytes XXTEA::pad(const Bytes& data) {
    Bytes padded(data);
    padded.resize((data.size() + 3) / 4 * 4, 0);
    return padded;
}

Bytes XXTEA::encrypt(const Bytes& data, const uint32_t* key, size_t key_words) {
    if (key_words < 4) {
        throw std::invalid_argument("XXTEA key needs at least 4 words");
    }

    Bytes padded = pad(data);
    const size_t n = padded.size() / 4;
    if (n <= 1) return padded;

    std::vector<uint32_t> v = to_words(padded);
    const size_t u = n - 1;
    uint32_t rounds = 6 + static_cast<uint32_t>(52 / n);
    uint32_t sum = 0;
    uint32_t z = v[u];
    uint32_t y = 0;

    while (rounds-- > 0) {
        sum += wire::XXTEA_DELTA;
        const uint32_t e = (sum >> 2) & 3;
        size_t p = 0;
        for (; p < u; ++p) {
            y = v[p + 1];
            v[p] += mx(sum, y, z, p, e, key);
            z = v[p];
        }
        y = v[0];
        v[u] += mx(sum, y, z, p, e, key);
        z = v[u];
    }

    return from_words(v);
}

Bytes XXTEA::decrypt(const Bytes& data, const uint32_t* key, size_t key_words) {
    if (key_words < 4) {
        throw std::invalid_argument("XXTEA key needs at least 4 words");
    }

    Bytes padded = pad(data);
    const size_t n = padded.size() / 4;
    if (n <= 1) return padded;

    std::vector<uint32_t> v = to_words(padded);
    const size_t u = n - 1;
    uint32_t rounds = 6 + static_cast<uint32_t>(52 / n);
    uint32_t sum = rounds * wire::XXTEA_DELTA;
    uint32_t y = v[0];
    uint32_t z = 0;

    while (rounds-- > 0) {
        const uint32_t e = (sum >> 2) & 3;
        size_t p = u;
        for (; p > 0; --p) {
            z = v[p - 1];
            v[p] -= mx(sum, y, z, p, e, key);
            y = v[p];
        }
        z = v[u];
        v[0] -= mx(sum, y, z, 0, e, key);
        y = v[0];
        sum -= wire::XXTEA_DELTA;
    }

    return from_words(v);
}

std::array<uint32_t, 7> field_key(uint32_t field_index, double init_time_ms) {
    const auto& tail = wire::FIELD_KEY_TAIL;
    // JS ToUint32 semantics: the millisecond timestamp wraps modulo 2^32
    const double floored = std::floor(init_time_ms);
    const uint32_t t = static_cast<uint32_t>(
        static_cast<uint64_t>(static_cast<int64_t>(floored)));
    return {field_index, t, tail[0], tail[1], tail[2], tail[3], tail[4]};
}

Bytes field_encrypt(const Bytes& data, uint32_t field_index, double init_time_ms) {
    return XXTEA::encrypt(data, field_key(field_index, init_time_ms));
}

} // namespace castle
