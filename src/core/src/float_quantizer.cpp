/**
 * @file float_quantizer.cpp
 * @brief One-byte quantization of behavioral float metrics
 */

#include "../include/castle_float_quantizer.hpp"

#include <algorithm>
#include <cmath>

namespace castle {

uint32_t custom_float_encode(int exp_bits, int man_bits, double value) {
    if (value == 0.0) return 0;

    double n = std::fabs(value);
    int exp = 0;
    while (n >= 2.0) {
        n /= 2.0;
        ++exp;
    }
    while (n < 1.0 && n > 0.0) {
        n *= 2.0;
        --exp;
    }
    exp = std::min(exp, (1 << exp_bits) - 1);
    exp = std::max(exp, 0);

    double frac = n - std::floor(n);
    uint32_t mantissa = 0;
    for (int pos = 1; frac != 0.0 && pos <= man_bits; ++pos) {
        frac *= 2.0;
        const double bit = std::floor(frac);
        if (bit >= 1.0) mantissa |= 1u << (man_bits - pos);
        frac -= bit;
    }

    return (static_cast<uint32_t>(exp) << man_bits) | mantissa;
}

uint8_t encode_float_val(double v) {
    const double n = std::max(v, 0.0);
    if (n <= 15.0) {
        return static_cast<uint8_t>(64u | custom_float_encode(2, 4, n + 1.0));
    }
    return static_cast<uint8_t>(128u | custom_float_encode(4, 3, n - 14.0));
}

uint8_t encode_metric(double v) {
    return v == NO_DATA ? 0 : encode_float_val(v);
}

} // namespace castle
