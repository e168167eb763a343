#ifndef CASTLE_FIELD_ENCODER_HPP
#define CASTLE_FIELD_ENCODER_HPP

#include "castle_bytes.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace castle {

/**
 * @brief How a fingerprint field's value is serialized
 *
 * Every field starts with a header byte: field index in the upper 5 bits,
 * encoding tag in the lower 3. The tag is looked up in wire_tag(), not
 * taken from the enumerator value.
 */
enum class FieldEncoding : uint8_t {
    Empty,           ///< no body; presence alone is the signal
    Marker,          ///< no body, distinct tag
    Byte,            ///< one raw byte
    EncryptedBytes,  ///< [len][XXTEA ciphertext] under the per-field key
    CompactInt,      ///< 1 byte if <= 127, else 2 bytes big-endian with high bit set
    RoundedByte,     ///< one byte, value rounded half away from zero
    RawAppend,       ///< caller-built bytes appended verbatim
};

/**
 * @brief Lower 3 header bits for an encoding
 *
 * Empty is -1 in the SDK; masked with 7 in two's complement it becomes 7,
 * the same tag as RawAppend.
 */
uint8_t wire_tag(FieldEncoding encoding);

/// Field header byte: ((index & 31) << 3) | wire_tag(encoding)
uint8_t field_header(uint8_t index, FieldEncoding encoding);

/**
 * @brief One encoded field value
 *
 * Numeric encodings read `number`, byte encodings read `bytes`.
 */
struct FieldValue {
    double number    = 0.0;
    Bytes  bytes;
    bool   has_bytes = false;

    FieldValue() = default;
    FieldValue(double n) : number(n) {}
    FieldValue(int n) : number(n) {}
    FieldValue(uint32_t n) : number(n) {}
    FieldValue(Bytes b) : bytes(std::move(b)), has_bytes(true) {}
};

/**
 * @brief Serialize one field
 *
 * @param index     Field index (0-31); higher bits are masked off
 * @param encoding  Body encoding
 * @param value     Number or bytes, per encoding
 * @param init_time SDK init time in ms; required for EncryptedBytes
 * @throws EncodingError("initTime is required") for EncryptedBytes without init_time
 */
Bytes encode_field(uint8_t index, FieldEncoding encoding,
                   const FieldValue& value = {},
                   std::optional<double> init_time = std::nullopt);

/// CompactInt body without the header
Bytes compact_int(uint32_t value);

/**
 * @brief Pack set-bit positions into a big-endian bitfield
 *
 * Bit 0 is the least significant bit of the last byte. Positions outside
 * the field are dropped.
 */
Bytes encode_bits(const std::vector<int>& bits, size_t bit_size);

/**
 * @brief Screen dimension pair
 *
 * Compact 2-byte form (0x8000 | screen) when screen and available size
 * match, otherwise screen and available as two big-endian u16.
 */
Bytes screen_dim_bytes(uint32_t screen, uint32_t available);

/**
 * @brief Pack booleans MSB-first into a total_bits wide integer
 *
 * Extra flags beyond total_bits are dropped; a short list is left-aligned.
 */
uint32_t bools_to_bin(const std::vector<bool>& flags, size_t total_bits);

/// A list of fields prefixed by its (part << 5) | (count & 31) header byte
Bytes build_section(uint8_t part_index, const std::vector<Bytes>& fields);

} // namespace castle

#endif // CASTLE_FIELD_ENCODER_HPP
