/**
 * @file key_derivation.cpp
 * @brief Hex key slicing, nibble rotation and the XOR layers built on it
 */

#include "../include/castle_key_derivation.hpp"

#include <algorithm>
#include <stdexcept>

namespace castle {

Bytes derive_key(const std::string& key_hex, size_t slice_len, char rotate_nibble) {
    std::string sub = key_hex.substr(0, std::min(slice_len, key_hex.size()));
    if (sub.empty()) return {};

    const int rot_val = hex_digit_value(rotate_nibble);
    if (rot_val < 0) {
        throw std::invalid_argument(std::string("invalid rotation nibble: ") + rotate_nibble);
    }
    const size_t rot = static_cast<size_t>(rot_val) % sub.size();
    std::rotate(sub.begin(), sub.begin() + static_cast<std::ptrdiff_t>(rot), sub.end());
    return from_hex(sub);
}

Bytes derive_and_xor(const std::string& key_hex, size_t slice_len,
                     char rotate_nibble, const Bytes& data) {
    return xor_bytes(data, derive_key(key_hex, slice_len, rotate_nibble));
}

} // namespace castle
