#ifndef CASTLE_FINGERPRINT_HPP
#define CASTLE_FINGERPRINT_HPP

#include "castle_browser_profile.hpp"
#include "castle_bytes.hpp"
#include "castle_csprng.hpp"

#include <string>

namespace castle {

/**
 * @brief Fingerprint section builders
 *
 * Each returns [section header][fields...]. Field indices, order and
 * encodings are the wire contract of SDK 2.6.0 and must not be
 * reordered. Indices absent from a section are fields a Chrome browser
 * does not report.
 */
namespace fingerprint {

/**
 * @brief Media codec support, 2 bits per codec (0 no, 1 maybe, 2 probably)
 *
 * Order: webm, mp4, ogg, aac, x-m4a, wav, mpeg, ogg/vorbis; big-endian u16.
 */
Bytes codec_playability();

/**
 * @brief Part 0: device, screen and rendering fingerprint
 *
 * Carries the user agent, XXTEA-encrypted under field key 12 and wrapped
 * as [1][len][ciphertext] in a RawAppend field.
 */
Bytes build_device(double init_time, const BrowserProfile& profile,
                   const std::string& user_agent);

/// Part 4: timezone, languages and Chrome feature flags
Bytes build_browser(const BrowserProfile& profile, double init_time,
                    RandomSource& rng);

/// Part 7: SDK init timing (UTC minute of init_time)
Bytes build_timing(double init_time);

} // namespace fingerprint
} // namespace castle

#endif // CASTLE_FINGERPRINT_HPP
