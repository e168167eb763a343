/**
 * @file castle_constants.hpp
 * @brief Wire-format constants of the v11 fingerprint token
 *
 * These values are tied to one release of the counterpart SDK (2.6.0,
 * token format 11). They move together: bumping the SDK means revisiting
 * every constant in this file.
 */

#ifndef CASTLE_CONSTANTS_HPP
#define CASTLE_CONSTANTS_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace castle {
namespace wire {

// ==================== Versioning ====================

/// Token format version byte
constexpr uint8_t TOKEN_VERSION = 0x0B;

/// SDK 2.6.0 packed as (3<<13)|(1<<11)|(6<<6)|0
constexpr uint16_t SDK_VERSION = 0x6980;

/// Publishable key of the target site, without the "pk_" prefix
constexpr const char* PUBLISHER_KEY = "AvRa79bHyJSYSQHnRpcVtzyxetSvFerx";

// ==================== Cipher keys ====================

/// XXTEA key for the whole payload
constexpr std::array<uint32_t, 4> TOKEN_KEY = {
    1164413191u, 3891440048u, 185273099u, 2746598870u
};

/// Tail of the per-field key: [field_index, init_time, tail...]
constexpr std::array<uint32_t, 5> FIELD_KEY_TAIL = {
    16373134u, 643144773u, 1762804430u, 1186572681u, 1164413191u
};

/// DELTA of the TEA family
constexpr uint32_t XXTEA_DELTA = 0x9E3779B9u;

// ==================== Timestamps ====================

/// Seconds subtracted from Unix time before encoding (~Aug 23 2018)
constexpr int64_t TS_EPOCH_SECONDS = 1535000000;

/// Largest encodable timestamp (28 bits)
constexpr uint32_t TS_MAX = 0x0FFFFFFFu;

// ==================== Fingerprint sections ====================

/// Section part indices carried in the section header byte
constexpr uint8_t PART_DEVICE  = 0;
constexpr uint8_t PART_BROWSER = 4;
constexpr uint8_t PART_TIMING  = 7;

/// Terminator appended after the behavioral block
constexpr uint8_t FINGERPRINT_TERMINATOR = 0xFF;

// ==================== Sizes ====================

/// Random UUID carried in the header and returned as cuid
constexpr size_t UUID_BYTES = 16;

/// Hex characters of the timestamp key used by XOR layer 1
constexpr size_t TIMESTAMP_KEY_SLICE = 4;

/// Hex characters of the UUID key used by XOR layer 2
constexpr size_t UUID_KEY_SLICE = 8;

/// Position of the rotation nibble inside each key string
constexpr size_t TIMESTAMP_ROTATE_INDEX = 3;
constexpr size_t UUID_ROTATE_INDEX = 9;

/// Encrypted timestamp: 4 bytes + 2 byte millisecond slice
constexpr size_t ENCRYPTED_TIMESTAMP_BYTES = 6;

} // namespace wire
} // namespace castle

#endif // CASTLE_CONSTANTS_HPP
