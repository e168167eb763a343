/**
 * @file fingerprint.cpp
 * @brief Device, browser and timing fingerprint sections
 */

#include "../include/castle_fingerprint.hpp"
#include "../include/castle_constants.hpp"
#include "../include/castle_field_encoder.hpp"
#include "../include/castle_xxtea.hpp"

#include <cmath>

namespace castle {
namespace fingerprint {

namespace {

using E = FieldEncoding;

// Opaque digests captured from one Chrome 144 session
const Bytes MIME_TYPES_HASH      = {0x02, 0x7d, 0x5f, 0xc9, 0xa7};
const Bytes PLUGINS_HASH         = {0x05, 0x72, 0x93, 0x02, 0x08};
const Bytes NAVIGATOR_PROPS_HASH = {0x5d, 0xc5, 0xab, 0xb5, 0x88};
const char* CANVAS_FONT_HASH     = "54b4b5cf";
const char* CANVAS_CIRCLE_HASH   = "c6749e76";

// new Date(0).toLocaleString() in America/New_York
const char* EPOCH_LOCALE_STRING  = "12/31/1969, 7:00:00 PM";

} // namespace

Bytes codec_playability() {
    //                      webm mp4 ogg aac xm4a wav mpeg vorbis
    const uint8_t codecs[] = {2,   2,  0,  2,  1,   2,  2,   2};
    uint32_t bits = 0;
    for (uint8_t c : codecs) {
        bits = (bits << 2) | (c & 3u);
    }
    return be16(bits);
}

Bytes build_device(double init_time, const BrowserProfile& profile,
                   const std::string& user_agent) {
    const TimezoneInfo tz = timezone_info(
        profile.timezone, static_cast<int64_t>(std::floor(init_time)));

    const Bytes encrypted_ua = field_encrypt(text_bytes(user_agent), 12, init_time);
    Bytes ua_payload{1, static_cast<uint8_t>(encrypted_ua.size() & 0xFF)};
    append(ua_payload, encrypted_ua);

    const std::vector<Bytes> fields = {
        encode_field(0, E::Byte, 1),                                          // platform: Win32
        encode_field(1, E::Byte, 0),                                          // vendor: Google Inc.
        encode_field(2, E::EncryptedBytes, text_bytes(profile.locale), init_time),
        encode_field(3, E::RoundedByte, profile.device_memory_gb * 10),
        encode_field(4, E::RawAppend,
                     concat({screen_dim_bytes(profile.screen_width, profile.available_width),
                             screen_dim_bytes(profile.screen_height, profile.available_height)})),
        encode_field(5, E::CompactInt, profile.color_depth),
        encode_field(6, E::CompactInt, profile.hardware_concurrency),
        encode_field(7, E::RoundedByte, profile.device_pixel_ratio * 10),
        encode_field(8, E::RawAppend, Bytes{tz.offset, tz.dst_diff}),
        encode_field(9, E::RawAppend, MIME_TYPES_HASH),
        encode_field(10, E::RawAppend, PLUGINS_HASH),
        encode_field(11, E::RawAppend, concat({Bytes{12}, encode_bits({0, 1, 2, 3, 4, 5, 6}, 16)})),
        encode_field(12, E::RawAppend, ua_payload),
        encode_field(13, E::EncryptedBytes, text_bytes(CANVAS_FONT_HASH), init_time),
        encode_field(14, E::RawAppend, concat({Bytes{3}, encode_bits({0, 1, 2}, 8)})),  // media devices
        // 15 (doNotTrack) and 16 (javaEnabled) are not reported
        encode_field(17, E::Byte, 0),                                         // productSub
        encode_field(18, E::EncryptedBytes, text_bytes(CANVAS_CIRCLE_HASH), init_time),
        encode_field(19, E::EncryptedBytes, text_bytes(profile.gpu_renderer), init_time),
        encode_field(20, E::EncryptedBytes, text_bytes(EPOCH_LOCALE_STRING), init_time),
        encode_field(21, E::RawAppend, concat({Bytes{8}, encode_bits({}, 8)})),  // webdriver flags
        encode_field(22, E::CompactInt, 33),                                  // eval.toString().length
        // 23 (navigator.buildID) is Firefox only
        encode_field(24, E::CompactInt, 12549),                               // max recursion depth
        encode_field(25, E::Byte, 0),                                         // recursion error message
        encode_field(26, E::Byte, 1),                                         // recursion error name
        encode_field(27, E::CompactInt, 4644),                                // stack trace length
        encode_field(28, E::RawAppend, Bytes{0x00}),                          // touch support
        encode_field(29, E::Byte, 3),                                         // undefined call error
        encode_field(30, E::RawAppend, NAVIGATOR_PROPS_HASH),
        encode_field(31, E::RawAppend, codec_playability()),
    };

    return build_section(wire::PART_DEVICE, fields);
}

Bytes build_browser(const BrowserProfile& profile, double init_time,
                    RandomSource& rng) {
    // Known zones travel as a one-byte enum, anything else as an encrypted string
    const auto tz_enum = timezone_enum(profile.timezone);
    Bytes timezone_field = tz_enum
        ? encode_field(1, E::Byte, static_cast<int>(*tz_enum))
        : encode_field(1, E::EncryptedBytes, text_bytes(profile.timezone), init_time);

    const uint32_t inner_outer_diff = static_cast<uint32_t>(rng.uniform_int(10, 30));

    const std::vector<Bytes> fields = {
        encode_field(0, E::Byte, 0),
        timezone_field,
        encode_field(2, E::EncryptedBytes,
                     text_bytes(profile.locale + "," + profile.language), init_time),
        encode_field(6, E::CompactInt, 0),                                    // expected property count
        encode_field(10, E::RawAppend, concat({Bytes{4}, encode_bits({1, 2, 3}, 8)})),
        encode_field(12, E::CompactInt, 80),                                  // negative error string length
        encode_field(13, E::RawAppend, Bytes{9, 0, 0}),                       // driver checks
        encode_field(17, E::RawAppend, concat({Bytes{0x0d}, encode_bits({1, 5, 8, 9, 10}, 16)})),
        encode_field(18, E::Marker),
        encode_field(21, E::RawAppend, Bytes{0, 0, 0, 0}),                    // class property counts
        encode_field(22, E::EncryptedBytes, text_bytes(profile.locale), init_time),
        encode_field(23, E::RawAppend, concat({Bytes{2}, encode_bits({0}, 8)})),  // worker capabilities
        encode_field(24, E::RawAppend, concat({be16(0), be16(inner_outer_diff)})),
    };

    return build_section(wire::PART_BROWSER, fields);
}

Bytes build_timing(double init_time) {
    // UTC minute of the init instant
    const int64_t ms = static_cast<int64_t>(std::floor(init_time));
    const int64_t minute_of_day = ((ms / 60000) % 1440 + 1440) % 1440;
    const uint32_t minute = static_cast<uint32_t>(minute_of_day % 60);

    const std::vector<Bytes> fields = {
        encode_field(3, E::CompactInt, 1),       // ms since window.open
        encode_field(4, E::CompactInt, minute),  // SDK init minute
    };

    return build_section(wire::PART_TIMING, fields);
}

} // namespace fingerprint
} // namespace castle
