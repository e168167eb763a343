#pragma once

/**
 * @file castle_browser_profile.hpp
 * @brief Simulated browser environments embedded in the fingerprint
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace castle {

class Config;

/// Chrome 144 on Windows 10; must match the User-Agent header of the login request
constexpr const char* DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/144.0.0.0 Safari/537.36";

/**
 * @brief Browser/hardware values reported by the fingerprint
 *
 * Supplied once per token and never mutated by the codec. The device
 * section hard-codes a Win32 platform, so profiles describe Chrome on
 * Windows machines.
 */
struct BrowserProfile {
    std::string locale;               ///< e.g. "en-US"
    std::string language;             ///< e.g. "en"
    std::string timezone;             ///< IANA name
    uint32_t    screen_width      = 0;
    uint32_t    screen_height     = 0;
    uint32_t    available_width   = 0;  ///< screen minus OS chrome (taskbar)
    uint32_t    available_height  = 0;
    std::string gpu_renderer;         ///< WebGL ANGLE renderer string
    double      device_memory_gb  = 0;  ///< encoded x10
    uint32_t    hardware_concurrency = 0;
    uint32_t    color_depth       = 0;
    double      device_pixel_ratio = 1.0;  ///< encoded x10

    /// Built-in profiles
    static BrowserProfile chrome_windows();          ///< default: 1080p desktop, GTX 1080 Ti
    static BrowserProfile chrome_windows_laptop();   ///< 1366x768 laptop, Intel UHD
    static BrowserProfile chrome_windows_1440p();    ///< 1440p desktop, RTX 3070

    /// Built-in profile by name, std::nullopt if unknown
    static std::optional<BrowserProfile> by_name(const std::string& name);

    /// Names accepted by by_name()
    static std::vector<std::string> names();

    /**
     * @brief Profile from configuration
     *
     * Starts from profile.name (default chrome_windows) and applies any
     * profile.* overrides present in cfg.
     * @throws std::invalid_argument for an unknown profile.name
     */
    static BrowserProfile from_config(const Config& cfg);
};

/**
 * @brief Timezone values as sent by the device section
 *
 * Both are minutes / 15, floored, as unsigned bytes (negative offsets
 * wrap, e.g. UTC+8 -> 224).
 */
struct TimezoneInfo {
    uint8_t offset   = 0;  ///< current offset, UTC minus local
    uint8_t dst_diff = 0;  ///< |January offset - July offset|
};

/**
 * @brief Timezone info for an IANA zone at a given instant
 *
 * Offsets come from standard UTC offsets plus the zone's DST rule
 * (US, EU or none) evaluated at now_ms. Unknown zones fall back to
 * America/New_York standard time {20, 4}.
 */
TimezoneInfo timezone_info(const std::string& tz, int64_t now_ms);

/// Compact enum used by the browser section, std::nullopt if the zone has none
std::optional<uint8_t> timezone_enum(const std::string& tz);

} // namespace castle
