#ifndef CASTLE_TOKEN_INSPECTOR_HPP
#define CASTLE_TOKEN_INSPECTOR_HPP

#include "castle_bytes.hpp"
#include "castle_timestamp.hpp"

#include <cstdint>
#include <string>

namespace castle {

/**
 * @brief Decoded content of a v11 token
 */
struct TokenInfo {
    uint8_t          version     = 0;
    uint8_t          padding     = 0;  ///< zero bytes added before XXTEA
    uint16_t         sdk_version = 0;
    std::string      publisher_key;
    std::string      cuid;             ///< UUID hex, equals the generator's cuid
    DecodedTimestamp init_time;
    DecodedTimestamp send_time;
    Bytes            fingerprint;      ///< sections + event log + behavior + 0xFF
};

/**
 * @brief Undo every layer of a token produced by TokenGenerator
 *
 * Verifies the checksum and version byte, decrypts with the token key
 * and removes both XOR layers.
 * @throws TokenFormatError on malformed input
 */
TokenInfo inspect_token(const std::string& token);

} // namespace castle

#endif // CASTLE_TOKEN_INSPECTOR_HPP
