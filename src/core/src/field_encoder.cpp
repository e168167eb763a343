/**
 * @file field_encoder.cpp
 * @brief Tagged-field wire encoding and bit packing helpers
 */

#include "../include/castle_field_encoder.hpp"
#include "../include/castle_error.hpp"
#include "../include/castle_xxtea.hpp"

#include <cmath>

namespace castle {

uint8_t wire_tag(FieldEncoding encoding) {
    switch (encoding) {
        case FieldEncoding::Empty:          return 7;   // -1 & 7
        case FieldEncoding::Marker:         return 1;
        case FieldEncoding::Byte:           return 3;
        case FieldEncoding::EncryptedBytes: return 4;
        case FieldEncoding::CompactInt:     return 5;
        case FieldEncoding::RoundedByte:    return 6;
        case FieldEncoding::RawAppend:      return 7;
    }
    return 0;
}

uint8_t field_header(uint8_t index, FieldEncoding encoding) {
    return static_cast<uint8_t>(((index & 31u) << 3) | (wire_tag(encoding) & 7u));
}

Bytes compact_int(uint32_t value) {
    if (value <= 127) {
        return {static_cast<uint8_t>(value)};
    }
    return be16(0x8000u | (value & 0x7FFFu));
}

Bytes encode_field(uint8_t index, FieldEncoding encoding,
                   const FieldValue& value, std::optional<double> init_time) {
    Bytes out{field_header(index, encoding)};

    switch (encoding) {
        case FieldEncoding::Empty:
        case FieldEncoding::Marker:
            break;

        case FieldEncoding::Byte:
            out.push_back(static_cast<uint8_t>(static_cast<int64_t>(value.number) & 0xFF));
            break;

        case FieldEncoding::RoundedByte:
            // std::round is half away from zero; inputs here are non-negative
            out.push_back(static_cast<uint8_t>(
                static_cast<int64_t>(std::round(value.number)) & 0xFF));
            break;

        case FieldEncoding::CompactInt:
            append(out, compact_int(static_cast<uint32_t>(value.number)));
            break;

        case FieldEncoding::EncryptedBytes: {
            if (!init_time) {
                throw EncodingError("initTime is required");
            }
            Bytes enc = field_encrypt(value.bytes, index, *init_time);
            out.push_back(static_cast<uint8_t>(enc.size() & 0xFF));
            append(out, enc);
            break;
        }

        case FieldEncoding::RawAppend:
            if (value.has_bytes) {
                append(out, value.bytes);
            } else {
                out.push_back(static_cast<uint8_t>(static_cast<int64_t>(value.number) & 0xFF));
            }
            break;
    }

    return out;
}

Bytes encode_bits(const std::vector<int>& bits, size_t bit_size) {
    const size_t num_bytes = bit_size / 8;
    Bytes arr(num_bytes, 0);
    for (int bit : bits) {
        if (bit < 0) continue;
        const size_t from_end = static_cast<size_t>(bit) / 8;
        if (from_end >= num_bytes) continue;
        arr[num_bytes - 1 - from_end] |= static_cast<uint8_t>(1u << (bit % 8));
    }
    return arr;
}

Bytes screen_dim_bytes(uint32_t screen, uint32_t available) {
    const uint32_t r = screen & 0x7FFFu;
    const uint32_t e = available & 0xFFFFu;
    if (r == e) {
        return be16(0x8000u | r);
    }
    return concat({be16(r), be16(e)});
}

uint32_t bools_to_bin(const std::vector<bool>& flags, size_t total_bits) {
    const size_t c = flags.size() > total_bits ? total_bits : flags.size();
    uint32_t r = 0;
    for (size_t i = 0; i < c; ++i) {
        if (flags[i]) r |= 1u << (c - i - 1);
    }
    if (c < total_bits) r <<= (total_bits - c);
    return r;
}

Bytes build_section(uint8_t part_index, const std::vector<Bytes>& fields) {
    Bytes out;
    out.push_back(static_cast<uint8_t>(((part_index & 7u) << 5) |
                                       (fields.size() & 31u)));
    for (const auto& f : fields) append(out, f);
    return out;
}

} // namespace castle
