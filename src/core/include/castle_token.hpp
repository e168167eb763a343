#ifndef CASTLE_TOKEN_HPP
#define CASTLE_TOKEN_HPP

/**
 * @file castle_token.hpp
 * @brief v11 device-fingerprint token assembly
 *
 * Pipeline per call:
 *   sections + event log + behavior + 0xFF
 *   -> XOR layer 1 (key from the obfuscated send timestamp)
 *   -> send timestamp bytes prepended, XOR layer 2 (key from the UUID)
 *   -> header [init timestamp][SDK version][publisher key][UUID] prepended
 *   -> XXTEA under the token key
 *   -> [version][padding] prepended, checksum appended
 *   -> single random byte XOR, random byte prepended
 *   -> Base64URL without padding
 *
 * Nothing is cached between calls; concurrent calls are safe as long as
 * each thread uses its own RandomSource (the default one is thread_local).
 */

#include "castle_browser_profile.hpp"
#include "castle_bytes.hpp"
#include "castle_csprng.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace castle {

/**
 * @brief Generated token and its companion cookie value
 */
struct CastleToken {
    std::string token;  ///< Base64URL, [A-Za-z0-9_-]
    std::string cuid;   ///< UUID as 32 lowercase hex chars, sent as the __cuid cookie
};

/// Unix time in milliseconds
using Clock = std::function<int64_t()>;

/// std::chrono::system_clock in milliseconds
int64_t system_clock_ms();

/**
 * @brief Builds tokens from a profile, a user agent and injected randomness
 */
class TokenGenerator {
public:
    explicit TokenGenerator(RandomSource& rng, Clock clock = system_clock_ms);

    /**
     * @brief Generate a token
     *
     * @param user_agent Same string as the request's User-Agent header;
     *                   the verifier cross-checks the two
     * @param profile    Simulated browser environment
     */
    CastleToken generate(const std::string& user_agent,
                         const BrowserProfile& profile = BrowserProfile::chrome_windows());

    /// Token header: [obfuscated init timestamp][SDK version][publisher key][UUID]
    Bytes build_header(const std::string& uuid_hex, double init_time);

    /// Fingerprint payload before any XOR layer, 0xFF terminated
    Bytes build_fingerprint(double init_time, const BrowserProfile& profile,
                            const std::string& user_agent);

    /**
     * @brief Outer framing: version, padding, checksum and random XOR mask
     *
     * @param plaintext  Header + double-XORed payload
     * @return [mask][([TOKEN_VERSION][pad][XXTEA(plaintext)][checksum]) ^ mask]
     */
    Bytes seal(const Bytes& plaintext);

private:
    RandomSource& rng_;
    Clock clock_;
};

/**
 * @brief Generate a token with the default random source, system clock
 *        and the chrome_windows profile
 */
CastleToken generate_token(const std::string& user_agent);

} // namespace castle

#endif // CASTLE_TOKEN_HPP
