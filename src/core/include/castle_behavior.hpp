#ifndef CASTLE_BEHAVIOR_HPP
#define CASTLE_BEHAVIOR_HPP

#include "castle_bytes.hpp"
#include "castle_csprng.hpp"

#include <cstdint>

namespace castle {
namespace behavior {

/**
 * @brief DOM event ids of the simulated event log
 */
enum EventType : uint8_t {
    CLICK          = 0,
    FOCUS          = 5,
    BLUR           = 6,
    ANIMATIONSTART = 18,
    MOUSEMOVE      = 21,
    MOUSELEAVE     = 25,
    MOUSEENTER     = 26,
    RESIZE         = 27,
};

/// Set on event ids followed by a target byte
constexpr uint8_t HAS_TARGET_FLAG = 0x80;

/// Target id for "element not tracked"
constexpr uint8_t TARGET_UNKNOWN = 63;

constexpr int MIN_EVENTS = 30;
constexpr int MAX_EVENTS = 70;

/// Number of quantized float metrics
constexpr size_t FLOAT_METRIC_COUNT = 53;

/// Number of event counters (the length byte follows them)
constexpr size_t EVENT_COUNTER_COUNT = 11;

/**
 * @brief Simulated DOM event log
 *
 * 30-70 events drawn from a fixed vocabulary. CLICK/FOCUS/BLUR carry a
 * target: emitted as (id | 0x80), TARGET_UNKNOWN.
 * Layout: [inner_len:u16][0x00][count:u16][events...]
 */
Bytes generate_event_log(RandomSource& rng);

/**
 * @brief 3-byte tagged bitfield of observed interaction kinds
 *
 * Mouse and keyboard seen, no touch: (6 << 20) | (2 << 16) | flags16.
 */
Bytes behavioral_bitfield();

/// FLOAT_METRIC_COUNT quantized mouse/key statistics; unavailable metrics are 0
Bytes float_metrics(RandomSource& rng);

/// Small event counters followed by their count
Bytes event_counts(RandomSource& rng);

/// behavioral_bitfield() + float_metrics() + event_counts()
Bytes build_behavioral_data(RandomSource& rng);

} // namespace behavior
} // namespace castle

#endif // CASTLE_BEHAVIOR_HPP
