/**
 * DeterministicRng - Seeded PRNG shared by every engine in the core.
 *
 * mulberry32: one additive increment on a 32-bit state, then two
 * xor-shift/multiply mixing rounds, divided by 2^32. Pure unsigned 32-bit
 * arithmetic, so a given seed yields the same sequence on every platform
 * and in every language port of the algorithm.
 *
 * Header-only. One instance per session; not thread-safe.
 */

#ifndef RTP_CORE_DETERMINISTIC_RNG_HPP
#define RTP_CORE_DETERMINISTIC_RNG_HPP

#include "core/errors.hpp"
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

namespace rtp {

class DeterministicRng {
public:
    explicit DeterministicRng(uint32_t seed)
        : seed_(seed), state_(seed) {}

    /** Seeds from the platform entropy source. */
    DeterministicRng() : DeterministicRng(random_seed()) {}

    /** Next double in [0, 1). */
    double next() {
        state_ += 0x6D2B79F5u;
        uint32_t t = state_;

        t = imul(t ^ (t >> 15), t | 1u);
        t ^= t + imul(t ^ (t >> 7), t | 61u);

        return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
    }

    /** Bernoulli trial. p <= 0 never fires, p >= 1 always fires. */
    bool chance(double p) {
        return next() < p;
    }

    /** Inclusive integer in [lo, hi]. */
    int next_int(int lo, int hi) {
        if (hi < lo) {
            throw InvalidArgument("next_int: empty range [" + std::to_string(lo) +
                                  ", " + std::to_string(hi) + "]");
        }
        const double span = static_cast<double>(hi) - static_cast<double>(lo) + 1.0;
        return static_cast<int>(std::floor(next() * span) + lo);
    }

    /** Uniform double in [a, b). */
    double uniform(double a, double b) {
        return a + next() * (b - a);
    }

    template <typename T>
    const T& pick(const std::vector<T>& items) {
        if (items.empty()) {
            throw InvalidArgument("pick: empty collection");
        }
        size_t index = static_cast<size_t>(
            std::floor(next() * static_cast<double>(items.size())));
        return items[index];
    }

    uint32_t seed() const { return seed_; }
    uint32_t state() const { return state_; }

    /** Seed as 8 upper-case hex digits, e.g. "5EEDC0DE". */
    std::string seed_hex() const {
        char buf[9];
        std::snprintf(buf, sizeof(buf), "%08X", static_cast<unsigned>(seed_));
        return buf;
    }

    static uint32_t random_seed() {
        std::random_device rd;
        return static_cast<uint32_t>(rd());
    }

private:
    uint32_t seed_;
    uint32_t state_;

    // Low 32 bits of the full product.
    static uint32_t imul(uint32_t a, uint32_t b) {
        return static_cast<uint32_t>(
            static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
    }
};

} // namespace rtp

#endif // RTP_CORE_DETERMINISTIC_RNG_HPP
