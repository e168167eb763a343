#ifndef CASTLE_CSPRNG_HPP
#define CASTLE_CSPRNG_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace castle {

/**
 * @brief Source of randomness injected into the token pipeline
 *
 * Every random draw the generator makes (UUID, XOR mask byte, timestamp
 * key nibble, jittered init time, simulated behavior) goes through one
 * of these, so a caller can swap the platform CSPRNG for a seeded
 * source in tests.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Fill buf with len random bytes
    virtual void fill(uint8_t* buf, size_t len) = 0;

    /// Uniform value in [0, upper_bound); returns 0 when upper_bound <= 1
    virtual uint32_t uniform(uint32_t upper_bound) = 0;

    /// Uniform double in [min, max)
    virtual double uniform_double(double min, double max) = 0;

    /// Uniform integer in [min, max] (inclusive)
    int uniform_int(int min, int max);

    std::vector<uint8_t> bytes(size_t len);
    uint8_t byte();
};

/**
 * @brief libsodium-backed source (randombytes_*)
 *
 * If sodium_init() fails the source degrades to std::mt19937_64 seeded
 * from std::random_device. Output stays well-formed; only resistance to
 * statistical detection is weaker.
 */
class SodiumRandomSource : public RandomSource {
public:
    SodiumRandomSource();

    void fill(uint8_t* buf, size_t len) override;
    uint32_t uniform(uint32_t upper_bound) override;
    double uniform_double(double min, double max) override;

    bool is_cryptographic() const { return sodium_ready_; }

private:
    bool sodium_ready_;
    std::unique_ptr<std::mt19937_64> fallback_;
};

/**
 * @brief Deterministic source for tests and reproducible runs
 */
class SeededRandomSource : public RandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : engine_(seed) {}

    void fill(uint8_t* buf, size_t len) override;
    uint32_t uniform(uint32_t upper_bound) override;
    double uniform_double(double min, double max) override;

private:
    std::mt19937_64 engine_;
};

/**
 * @brief Access to the process-wide default source
 *
 * The default source is a thread_local SodiumRandomSource, so concurrent
 * generator threads never share engine state.
 */
class CSPRNG {
public:
    static RandomSource& default_source();
};

} // namespace castle

#endif // CASTLE_CSPRNG_HPP
