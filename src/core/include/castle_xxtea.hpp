#ifndef CASTLE_XXTEA_HPP
#define CASTLE_XXTEA_HPP

#include "castle_bytes.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace castle {

/**
 * @brief XXTEA (Corrected Block TEA) over little-endian 32-bit words
 *
 * Input is zero-padded to a 4-byte boundary. A padded buffer of one word
 * or less is returned as-is: XXTEA needs at least two words to mix, and
 * the counterpart SDK sends such short fields unencrypted in the same way.
 *
 * The key may hold any number of words; the mixing step indexes it with
 * (p & 3) ^ e, so only the first four words ever take part. The per-field
 * key [index, init_time, tail...] relies on that.
 */
class XXTEA {
public:
    /// Pad data to a multiple of 4 bytes with zeros
    static Bytes pad(const Bytes& data);

    static Bytes encrypt(const Bytes& data, const uint32_t* key, size_t key_words);
    static Bytes decrypt(const Bytes& data, const uint32_t* key, size_t key_words);

    template <size_t N>
    static Bytes encrypt(const Bytes& data, const std::array<uint32_t, N>& key) {
        static_assert(N >= 4, "XXTEA key needs at least 4 words");
        return encrypt(data, key.data(), N);
    }

    template <size_t N>
    static Bytes decrypt(const Bytes& data, const std::array<uint32_t, N>& key) {
        static_assert(N >= 4, "XXTEA key needs at least 4 words");
        return decrypt(data, key.data(), N);
    }
};

/// Per-field key: [field_index, floor(init_time), FIELD_KEY_TAIL...]
std::array<uint32_t, 7> field_key(uint32_t field_index, double init_time_ms);

/// XXTEA under the per-field key
Bytes field_encrypt(const Bytes& data, uint32_t field_index, double init_time_ms);

} // namespace castle

#endif // CASTLE_XXTEA_HPP
