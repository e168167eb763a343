#ifndef CASTLE_BYTES_HPP
#define CASTLE_BYTES_HPP

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace castle {

using Bytes = std::vector<uint8_t>;

/// Append src to the end of dst
void append(Bytes& dst, const Bytes& src);

/// Concatenate any number of buffers
Bytes concat(std::initializer_list<Bytes> parts);

/// 16-bit value as 2 big-endian bytes
Bytes be16(uint32_t v);

/// 32-bit value as 4 big-endian bytes
Bytes be32(uint32_t v);

/// UTF-8 bytes of a string
Bytes text_bytes(const std::string& s);

/// Cyclic XOR of data with key; returns data unchanged when key is empty
Bytes xor_bytes(const Bytes& data, const Bytes& key);

/// Lowercase hex, two characters per byte
std::string to_hex(const Bytes& data);

/**
 * @brief Parse a hex string into bytes
 *
 * A trailing odd nibble is ignored.
 * @throws std::invalid_argument on a non-hex character
 */
Bytes from_hex(const std::string& hex);

/// Value of one hex digit, or -1
int hex_digit_value(char c);

/// Base64URL without '=' padding
std::string base64url_encode(const Bytes& data);

/// Inverse of base64url_encode; std::nullopt on malformed input
std::optional<Bytes> base64url_decode(const std::string& text);

} // namespace castle

#endif // CASTLE_BYTES_HPP
