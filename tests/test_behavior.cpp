#include <gtest/gtest.h>
#include "castle_behavior.hpp"
#include "castle_float_quantizer.hpp"

using namespace castle;
using namespace castle::behavior;

namespace {

bool is_targeted(uint8_t id) {
    return id == CLICK || id == FOCUS || id == BLUR;
}

} // namespace

// ─── event log ───────────────────────────────────────────────────────────────

TEST(EventLogTest, FramingAndVocabulary) {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
        SeededRandomSource rng(seed);
        const Bytes log = generate_event_log(rng);
        ASSERT_GE(log.size(), 5u);

        const size_t inner_len = (static_cast<size_t>(log[0]) << 8) | log[1];
        EXPECT_EQ(inner_len, log.size() - 2);
        EXPECT_EQ(log[2], 0);

        const int count = (log[3] << 8) | log[4];
        EXPECT_GE(count, MIN_EVENTS);
        EXPECT_LE(count, MAX_EVENTS);

        int seen = 0;
        size_t pos = 5;
        while (pos < log.size()) {
            const uint8_t b = log[pos++];
            if (b & HAS_TARGET_FLAG) {
                EXPECT_TRUE(is_targeted(b & 0x7F)) << "event " << int(b);
                ASSERT_LT(pos, log.size());
                EXPECT_EQ(log[pos++], TARGET_UNKNOWN);
            } else {
                EXPECT_FALSE(is_targeted(b)) << "targeted event without flag";
                EXPECT_TRUE(b == MOUSEMOVE || b == ANIMATIONSTART || b == MOUSELEAVE ||
                            b == MOUSEENTER || b == RESIZE) << "event " << int(b);
            }
            ++seen;
        }
        EXPECT_EQ(seen, count);
    }
}

// ─── behavioral data ─────────────────────────────────────────────────────────

TEST(BehaviorTest, BitfieldIsFixed) {
    EXPECT_EQ(behavioral_bitfield(), (Bytes{0x62, 0x36, 0x58}));
}

TEST(BehaviorTest, FloatMetrics) {
    SeededRandomSource rng(7);
    const Bytes m = float_metrics(rng);
    ASSERT_EQ(m.size(), FLOAT_METRIC_COUNT);

    // unavailable touch metrics
    for (size_t i : {1u, 3u, 5u, 12u, 15u, 19u, 28u, 31u}) {
        EXPECT_EQ(m[i], 0) << "index " << i;
    }
    // fixed zero and one values
    EXPECT_EQ(m[6], encode_float_val(0));
    EXPECT_EQ(m[38], encode_float_val(1.0));
    EXPECT_EQ(m[51], encode_float_val(1));
    EXPECT_EQ(m[52], encode_float_val(0));
    // values above 15 use the wide format
    EXPECT_EQ(m[20] & 0xC0, 0x80);
}

TEST(BehaviorTest, EventCounts) {
    SeededRandomSource rng(99);
    const Bytes c = event_counts(rng);
    ASSERT_EQ(c.size(), EVENT_COUNTER_COUNT + 1);
    EXPECT_EQ(c.back(), EVENT_COUNTER_COUNT);
    EXPECT_GE(c[0], 100);
    EXPECT_LE(c[0], 200);
    EXPECT_EQ(c[3], 0);
    EXPECT_EQ(c[5], 0);
    EXPECT_EQ(c[6], 0);
    EXPECT_EQ(c[7], 0);
}

TEST(BehaviorTest, BehavioralDataLayout) {
    SeededRandomSource rng(3);
    const Bytes data = build_behavioral_data(rng);
    EXPECT_EQ(data.size(), 3 + FLOAT_METRIC_COUNT + EVENT_COUNTER_COUNT + 1);
    EXPECT_EQ(Bytes(data.begin(), data.begin() + 3), behavioral_bitfield());
}
