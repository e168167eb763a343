/**
 * @file csprng.cpp
 * @brief RandomSource implementations (libsodium CSPRNG + seeded fallback)
 */

#include "../include/castle_csprng.hpp"
#include "../include/castle_logger.hpp"

// libsodium provides the platform CSPRNG
#ifndef HAVE_SODIUM
#error "libsodium is required for random generation. Please install libsodium and rebuild with -DHAVE_SODIUM=ON"
#endif

#include <sodium.h>

namespace castle {

// ─── RandomSource ─────────────────────────────────────────────────────────────

int RandomSource::uniform_int(int min, int max) {
    if (max <= min) return min;
    uint32_t span = static_cast<uint32_t>(max - min) + 1;
    return min + static_cast<int>(uniform(span));
}

std::vector<uint8_t> RandomSource::bytes(size_t len) {
    std::vector<uint8_t> out(len);
    if (len > 0) fill(out.data(), len);
    return out;
}

uint8_t RandomSource::byte() {
    uint8_t val = 0;
    fill(&val, sizeof(val));
    return val;
}

// ─── SodiumRandomSource ───────────────────────────────────────────────────────

SodiumRandomSource::SodiumRandomSource()
    : sodium_ready_(sodium_init() >= 0)
{
    if (!sodium_ready_) {
        CASTLE_LOG_WARN("libsodium init failed, falling back to mt19937_64; "
                        "tokens stay valid but are easier to fingerprint");
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd()};
        fallback_ = std::make_unique<std::mt19937_64>(seq);
    }
}

void SodiumRandomSource::fill(uint8_t* buf, size_t len) {
    if (len == 0) return;
    if (sodium_ready_) {
        randombytes_buf(buf, len);
        return;
    }
    std::uniform_int_distribution<int> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(*fallback_));
    }
}

uint32_t SodiumRandomSource::uniform(uint32_t upper_bound) {
    if (upper_bound <= 1) return 0;
    if (sodium_ready_) return randombytes_uniform(upper_bound);
    std::uniform_int_distribution<uint32_t> dist(0, upper_bound - 1);
    return dist(*fallback_);
}

double SodiumRandomSource::uniform_double(double min, double max) {
    if (max <= min) return min;
    // 53 random bits -> [0, 1)
    uint64_t raw = 0;
    fill(reinterpret_cast<uint8_t*>(&raw), sizeof(raw));
    double unit = static_cast<double>(raw >> 11) * (1.0 / 9007199254740992.0);
    return min + unit * (max - min);
}

// ─── SeededRandomSource ───────────────────────────────────────────────────────

void SeededRandomSource::fill(uint8_t* buf, size_t len) {
    std::uniform_int_distribution<int> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(engine_));
    }
}

uint32_t SeededRandomSource::uniform(uint32_t upper_bound) {
    if (upper_bound <= 1) return 0;
    std::uniform_int_distribution<uint32_t> dist(0, upper_bound - 1);
    return dist(engine_);
}

double SeededRandomSource::uniform_double(double min, double max) {
    if (max <= min) return min;
    std::uniform_real_distribution<double> dist(min, max);
    return dist(engine_);
}

// ─── Default source ───────────────────────────────────────────────────────────

RandomSource& CSPRNG::default_source() {
    thread_local SodiumRandomSource source;
    return source;
}

} // namespace castle
