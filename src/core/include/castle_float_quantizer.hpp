#ifndef CASTLE_FLOAT_QUANTIZER_HPP
#define CASTLE_FLOAT_QUANTIZER_HPP

#include <cstdint>

namespace castle {

/// Metric not collected; the caller writes raw byte 0 instead of quantizing
constexpr double NO_DATA = -1.0;

/**
 * @brief Narrow float: exp_bits exponent, man_bits mantissa, no sign
 *
 * The value is normalized into [1, 2) by repeated halving/doubling, the
 * exponent clamped to [0, 2^exp_bits - 1], and the fraction read out one
 * bit at a time by doubling. Returns 0 for 0.
 */
uint32_t custom_float_encode(int exp_bits, int man_bits, double value);

/**
 * @brief Quantize a behavioral metric into one byte
 *
 * [0, 15]  -> 0b01xxxxxx, 2-bit exponent / 4-bit mantissa of (v + 1)
 * (15, ∞)  -> 0b1xxxxxxx, 4-bit exponent / 3-bit mantissa of (v - 14)
 * Negative input is clamped to 0.
 */
uint8_t encode_float_val(double v);

/// encode_float_val, with NO_DATA mapped to 0
uint8_t encode_metric(double v);

} // namespace castle

#endif // CASTLE_FLOAT_QUANTIZER_HPP
