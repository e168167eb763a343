/**
 * @file behavior.cpp
 * @brief Synthetic DOM event log and interaction statistics
 *
 * Values are drawn from ranges observed for a desktop user who moved
 * the mouse, clicked and typed before submitting the login form.
 */

#include "../include/castle_behavior.hpp"
#include "../include/castle_field_encoder.hpp"
#include "../include/castle_float_quantizer.hpp"

#include <algorithm>
#include <array>
#include <vector>

namespace castle {
namespace behavior {

Bytes generate_event_log(RandomSource& rng) {
    static const std::array<uint8_t, 8> vocabulary = {
        MOUSEMOVE, ANIMATIONSTART, MOUSELEAVE, MOUSEENTER, RESIZE,
        CLICK, BLUR, FOCUS,
    };
    static const std::array<uint8_t, 3> targeted = {CLICK, BLUR, FOCUS};

    const int count = rng.uniform_int(MIN_EVENTS, MAX_EVENTS);
    Bytes events;
    events.reserve(static_cast<size_t>(count) * 2);

    for (int i = 0; i < count; ++i) {
        const uint8_t id = vocabulary[rng.uniform(static_cast<uint32_t>(vocabulary.size()))];
        if (std::find(targeted.begin(), targeted.end(), id) != targeted.end()) {
            events.push_back(id | HAS_TARGET_FLAG);
            events.push_back(TARGET_UNKNOWN);
        } else {
            events.push_back(id);
        }
    }

    Bytes inner = concat({Bytes{0}, be16(static_cast<uint32_t>(count)), events});
    return concat({be16(static_cast<uint32_t>(inner.size())), inner});
}

Bytes behavioral_bitfield() {
    std::vector<bool> flags(15, false);
    flags[2]  = true;  // click
    flags[3]  = true;  // keydown
    flags[5]  = true;  // backspace
    flags[6]  = true;  // not a touch device
    flags[9]  = true;  // mouse movement
    flags[11] = true;  // focus
    flags[12] = true;  // scroll

    const uint32_t packed = bools_to_bin(flags, 16);
    const uint32_t encoded = (6u << 20) | (2u << 16) | (packed & 0xFFFFu);
    return {static_cast<uint8_t>((encoded >> 16) & 0xFF),
            static_cast<uint8_t>((encoded >> 8) & 0xFF),
            static_cast<uint8_t>(encoded & 0xFF)};
}

Bytes float_metrics(RandomSource& rng) {
    auto r = [&rng](double lo, double hi) { return rng.uniform_double(lo, hi); };

    const std::array<double, FLOAT_METRIC_COUNT> metrics = {
        // mouse & key timing
        r(40, 50),   //  0 mouse angle vector mean
        NO_DATA,     //  1 touch angle vector
        r(70, 80),   //  2 key same-time difference
        NO_DATA,     //  3
        r(60, 70),   //  4 mouse down-to-up mean
        NO_DATA,     //  5
        0,           //  6
        0,           //  7 mouse click time difference

        // duration distributions
        r(60, 80),   //  8 mouse down-up median
        r(5, 10),    //  9 mouse down-up std dev
        r(30, 40),   // 10 key press median
        r(2, 5),     // 11 key press std dev

        // touch metrics, desktop has none
        NO_DATA, NO_DATA, NO_DATA, NO_DATA,   // 12-15
        NO_DATA, NO_DATA, NO_DATA, NO_DATA,   // 16-19

        // mouse trajectory
        r(150, 180), // 20 movement angle mean
        r(3, 6),     // 21 movement angle std dev
        r(150, 180), // 22 angle mean, 500ms window
        r(3, 6),     // 23 angle std dev, 500ms window
        r(0, 2),     // 24 position deviation x
        r(0, 2),     // 25 position deviation y
        0, 0,        // 26-27

        // touch gestures
        NO_DATA, NO_DATA, NO_DATA, NO_DATA,   // 28-31

        // key transitions: letter-digit, digit-invalid, double-invalid
        0, 0, 0, 0, 0, 0,                     // 32-37

        // mouse vector differences
        1.0, 0,      // 38-39
        1.0, 0,      // 40-41
        r(0, 4),     // 42 500ms mean
        r(0, 3),     // 43 500ms std dev

        // rounded movement
        r(25, 50),   // 44 time diff mean
        r(25, 50),   // 45 time diff std dev
        r(25, 50),   // 46 vector diff mean
        r(25, 30),   // 47 vector diff std dev

        // speed changes
        r(0, 2),     // 48 mean
        r(0, 1),     // 49 std dev
        r(0, 1),     // 50 500ms aggregate

        1,           // 51 universal flag
        0,           // 52 terminator
    };

    Bytes out(metrics.size());
    std::transform(metrics.begin(), metrics.end(), out.begin(), encode_metric);
    return out;
}

Bytes event_counts(RandomSource& rng) {
    const std::array<int, EVENT_COUNTER_COUNT> counts = {
        rng.uniform_int(100, 200),  //  0 mousemove
        rng.uniform_int(1, 5),      //  1 keyup
        rng.uniform_int(1, 5),      //  2 click
        0,                          //  3 touchstart
        rng.uniform_int(0, 5),      //  4 keydown
        0,                          //  5 touchmove
        0,                          //  6 mousedown/up pairs
        0,                          //  7 vector diff samples
        rng.uniform_int(0, 5),      //  8 wheel
        rng.uniform_int(0, 11),     //  9
        rng.uniform_int(0, 1),      // 10
    };

    Bytes out;
    out.reserve(counts.size() + 1);
    for (int c : counts) out.push_back(static_cast<uint8_t>(c));
    out.push_back(static_cast<uint8_t>(counts.size()));
    return out;
}

Bytes build_behavioral_data(RandomSource& rng) {
    return concat({behavioral_bitfield(), float_metrics(rng), event_counts(rng)});
}

} // namespace behavior
} // namespace castle
