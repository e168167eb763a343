#ifndef CASTLE_KEY_DERIVATION_HPP
#define CASTLE_KEY_DERIVATION_HPP

#include "castle_bytes.hpp"

#include <string>

namespace castle {

/**
 * @brief Slice-and-rotate XOR key derived from a hex string
 *
 * Takes the first slice_len characters of key_hex, rotates them left by
 * hex(rotate_nibble) mod slice length, and decodes the result as bytes.
 * Returns an empty key when key_hex is empty.
 */
Bytes derive_key(const std::string& key_hex, size_t slice_len, char rotate_nibble);

/**
 * @brief XOR data cyclically with derive_key(key_hex, slice_len, rotate_nibble)
 *
 * An empty key leaves data unchanged. Applying the same call twice
 * restores the input.
 */
Bytes derive_and_xor(const std::string& key_hex, size_t slice_len,
                     char rotate_nibble, const Bytes& data);

} // namespace castle

#endif // CASTLE_KEY_DERIVATION_HPP
