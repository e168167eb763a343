#ifndef CASTLE_TIMESTAMP_HPP
#define CASTLE_TIMESTAMP_HPP

#include "castle_bytes.hpp"
#include "castle_csprng.hpp"

#include <cstdint>
#include <string>

namespace castle {

/**
 * @brief Seconds since TS_EPOCH_SECONDS as 4 big-endian bytes
 *
 * Clamped to [0, 0x0FFFFFFF]: earlier times encode as zero, far-future
 * times saturate.
 */
Bytes encode_timestamp_bytes(double ms);

/// floor(ms) reduced to its last three decimal digits
uint32_t millis_slice(double ms);

/**
 * @brief Nibble-obfuscated timestamp as 12 hex characters
 *
 * Two groups, each built from a big-endian value: the hex digits after
 * the first are XORed with key_nibble and the key's own hex digit is
 * appended. Group one carries the clamped seconds (8 chars), group two
 * the millisecond slice (4 chars). The last character of each group is
 * therefore its key.
 */
std::string encode_timestamp_encrypted(double ms, uint8_t key_nibble);

/// Same, with a fresh key nibble drawn from rng
std::string encode_timestamp_encrypted(double ms, RandomSource& rng);

/**
 * @brief Recovered fields of an obfuscated timestamp
 */
struct DecodedTimestamp {
    uint32_t seconds    = 0;  ///< seconds since TS_EPOCH_SECONDS
    uint32_t millis     = 0;  ///< millisecond slice
    uint8_t  key_nibble = 0;
};

/**
 * @brief Inverse of encode_timestamp_encrypted
 *
 * The dropped leading nibble is always zero (28-bit seconds, slice < 0x1000).
 * @throws std::invalid_argument if hex is not 12 hex characters
 */
DecodedTimestamp decode_timestamp_encrypted(const std::string& hex);

} // namespace castle

#endif // CASTLE_TIMESTAMP_HPP
