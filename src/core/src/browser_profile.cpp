/**
 * @file browser_profile.cpp
 * @brief Built-in browser profiles and timezone offset computation
 */

#include "../include/castle_browser_profile.hpp"
#include "../include/castle_config.hpp"
#include "../include/castle_logger.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace castle {

// ─── BrowserProfile factory methods ───────────────────────────────────────────

BrowserProfile BrowserProfile::chrome_windows() {
    BrowserProfile p;
    p.locale               = "en-US";
    p.language             = "en";
    p.timezone             = "America/New_York";
    p.screen_width         = 1920;
    p.screen_height        = 1080;
    p.available_width      = 1920;
    p.available_height     = 1032;  // 1080 minus the ~48px taskbar
    p.gpu_renderer         = "ANGLE (NVIDIA, NVIDIA GeForce GTX 1080 Ti Direct3D11 vs_5_0 ps_5_0, D3D11)";
    p.device_memory_gb     = 8;
    p.hardware_concurrency = 24;
    p.color_depth          = 24;
    p.device_pixel_ratio   = 1.0;
    return p;
}

BrowserProfile BrowserProfile::chrome_windows_laptop() {
    BrowserProfile p;
    p.locale               = "en-US";
    p.language             = "en";
    p.timezone             = "America/Chicago";
    p.screen_width         = 1366;
    p.screen_height        = 768;
    p.available_width      = 1366;
    p.available_height     = 728;
    p.gpu_renderer         = "ANGLE (Intel, Intel(R) UHD Graphics 620 Direct3D11 vs_5_0 ps_5_0, D3D11)";
    p.device_memory_gb     = 8;
    p.hardware_concurrency = 8;
    p.color_depth          = 24;
    p.device_pixel_ratio   = 1.25;
    return p;
}

BrowserProfile BrowserProfile::chrome_windows_1440p() {
    BrowserProfile p;
    p.locale               = "en-US";
    p.language             = "en";
    p.timezone             = "America/Los_Angeles";
    p.screen_width         = 2560;
    p.screen_height        = 1440;
    p.available_width      = 2560;
    p.available_height     = 1392;
    p.gpu_renderer         = "ANGLE (NVIDIA, NVIDIA GeForce RTX 3070 Direct3D11 vs_5_0 ps_5_0, D3D11)";
    p.device_memory_gb     = 8;
    p.hardware_concurrency = 16;
    p.color_depth          = 24;
    p.device_pixel_ratio   = 1.0;
    return p;
}

std::optional<BrowserProfile> BrowserProfile::by_name(const std::string& name) {
    if (name == "chrome_windows")        return chrome_windows();
    if (name == "chrome_windows_laptop") return chrome_windows_laptop();
    if (name == "chrome_windows_1440p")  return chrome_windows_1440p();
    return std::nullopt;
}

std::vector<std::string> BrowserProfile::names() {
    return {"chrome_windows", "chrome_windows_laptop", "chrome_windows_1440p"};
}

BrowserProfile BrowserProfile::from_config(const Config& cfg) {
    const std::string name = cfg.get("profile.name", "chrome_windows");
    auto base = by_name(name);
    if (!base) {
        throw std::invalid_argument("unknown browser profile: " + name);
    }

    BrowserProfile p = *base;
    p.locale       = cfg.get("profile.locale", p.locale);
    p.language     = cfg.get("profile.language", p.language);
    p.timezone     = cfg.get("profile.timezone", p.timezone);
    p.gpu_renderer = cfg.get("profile.gpu_renderer", p.gpu_renderer);

    // Negative overrides clamp to 0
    auto u32 = [&cfg](const char* key, uint32_t current) {
        const int v = cfg.getInt(key, static_cast<int>(current));
        return static_cast<uint32_t>(std::max(v, 0));
    };
    p.screen_width         = u32("profile.screen_width", p.screen_width);
    p.screen_height        = u32("profile.screen_height", p.screen_height);
    p.available_width      = u32("profile.avail_width", p.available_width);
    p.available_height     = u32("profile.avail_height", p.available_height);
    p.hardware_concurrency = u32("profile.hardware_concurrency", p.hardware_concurrency);
    p.color_depth          = u32("profile.color_depth", p.color_depth);
    p.device_memory_gb     = cfg.getDouble("profile.device_memory_gb", p.device_memory_gb);
    p.device_pixel_ratio   = cfg.getDouble("profile.device_pixel_ratio", p.device_pixel_ratio);
    return p;
}

// ─── Timezones ────────────────────────────────────────────────────────────────

namespace {

enum class DstRule { None, US, EU };

struct ZoneRule {
    int     std_offset_min;  ///< UTC minus local standard time
    DstRule dst;
};

const std::map<std::string, ZoneRule>& zone_table() {
    static const std::map<std::string, ZoneRule> table = {
        {"America/New_York",    { 300, DstRule::US}},
        {"America/Chicago",     { 360, DstRule::US}},
        {"America/Denver",      { 420, DstRule::US}},
        {"America/Los_Angeles", { 480, DstRule::US}},
        {"America/Sao_Paulo",   { 180, DstRule::None}},
        {"America/Mexico_City", { 360, DstRule::None}},
        {"Asia/Shanghai",       {-480, DstRule::None}},
        {"Asia/Tokyo",          {-540, DstRule::None}},
        {"Asia/Kolkata",        {-330, DstRule::None}},
        {"Europe/London",       {   0, DstRule::EU}},
        {"Europe/Berlin",       { -60, DstRule::EU}},
        {"Europe/Paris",        { -60, DstRule::EU}},
        {"UTC",                 {   0, DstRule::None}},
    };
    return table;
}

constexpr int64_t MS_PER_DAY    = 86400000;
constexpr int64_t MS_PER_MINUTE = 60000;

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

int64_t year_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

// 0 = Sunday
unsigned weekday(int64_t days) {
    return static_cast<unsigned>(days >= -4 ? (days + 4) % 7 : (days + 5) % 7 + 6);
}

int64_t nth_sunday(int64_t year, unsigned month, unsigned n) {
    const int64_t first = days_from_civil(year, month, 1);
    const unsigned to_sunday = (7 - weekday(first)) % 7;
    return first + to_sunday + 7 * (n - 1);
}

int64_t last_sunday(int64_t year, unsigned month) {
    const int64_t next_first = month == 12 ? days_from_civil(year + 1, 1, 1)
                                           : days_from_civil(year, month + 1, 1);
    const int64_t last = next_first - 1;
    return last - weekday(last);
}

bool dst_active(const ZoneRule& zone, int64_t now_ms) {
    const int64_t year = year_from_days(
        now_ms >= 0 ? now_ms / MS_PER_DAY : (now_ms - MS_PER_DAY + 1) / MS_PER_DAY);

    switch (zone.dst) {
        case DstRule::US: {
            // 02:00 local standard time -> 02:00 local daylight time (= 01:00 standard)
            const int64_t start = nth_sunday(year, 3, 2) * MS_PER_DAY +
                                  (120 + zone.std_offset_min) * MS_PER_MINUTE;
            const int64_t end   = nth_sunday(year, 11, 1) * MS_PER_DAY +
                                  (60 + zone.std_offset_min) * MS_PER_MINUTE;
            return now_ms >= start && now_ms < end;
        }
        case DstRule::EU: {
            // Both transitions at 01:00 UTC
            const int64_t start = last_sunday(year, 3) * MS_PER_DAY + 60 * MS_PER_MINUTE;
            const int64_t end   = last_sunday(year, 10) * MS_PER_DAY + 60 * MS_PER_MINUTE;
            return now_ms >= start && now_ms < end;
        }
        case DstRule::None:
            break;
    }
    return false;
}

uint8_t quarter_hours(int minutes) {
    const int q = static_cast<int>(std::floor(minutes / 15.0));
    return static_cast<uint8_t>(q & 0xFF);
}

} // namespace

TimezoneInfo timezone_info(const std::string& tz, int64_t now_ms) {
    const auto& table = zone_table();
    auto it = table.find(tz);
    if (it == table.end()) {
        CASTLE_LOG_WARN("Unknown timezone '" + tz + "', using America/New_York offsets");
        return {20, 4};
    }

    const ZoneRule& zone = it->second;
    const int dst_minutes = zone.dst == DstRule::None ? 0 : 60;
    const int current = zone.std_offset_min - (dst_active(zone, now_ms) ? dst_minutes : 0);

    TimezoneInfo info;
    info.offset   = quarter_hours(current);
    info.dst_diff = quarter_hours(dst_minutes);
    return info;
}

std::optional<uint8_t> timezone_enum(const std::string& tz) {
    static const std::map<std::string, uint8_t> enums = {
        {"America/New_York",    0},
        {"America/Sao_Paulo",   1},
        {"America/Chicago",     2},
        {"America/Los_Angeles", 3},
        {"America/Mexico_City", 4},
        {"Asia/Shanghai",       5},
    };
    auto it = enums.find(tz);
    if (it == enums.end()) return std::nullopt;
    return it->second;
}

} // namespace castle
