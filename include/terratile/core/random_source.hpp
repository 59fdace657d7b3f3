/**
 * @file random_source.hpp
 * @brief Seeded deterministic random source for map generation
 *
 * One RandomSource is created per generation pass and passed by reference to
 * every step that makes a random decision. The generator is integer-only
 * (splitmix64 seeding, xorshift64* stepping) so the same seed yields the same
 * sequence on every platform and standard library.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace terratile {

class RandomSource {
public:
    explicit RandomSource(uint64_t seed = 0);

    /// Restart the sequence from a new seed
    void reseed(uint64_t seed);

    [[nodiscard]] uint64_t seed() const { return seed_; }

    uint64_t nextU64();
    uint32_t nextU32();

    /// Uniform float in [0, 1)
    float nextFloat();

    /// Uniform integer in [low, high], both inclusive. Returns low if high <= low.
    int32_t nextInt(int32_t low, int32_t high);

    /// Fisher-Yates shuffle driven by nextInt
    template<typename T>
    void shuffle(std::vector<T>& items) {
        for (std::size_t i = items.size(); i > 1; --i) {
            auto j = static_cast<std::size_t>(nextInt(0, static_cast<int32_t>(i - 1)));
            std::swap(items[i - 1], items[j]);
        }
    }

private:
    uint64_t seed_ = 0;
    uint64_t state_ = 0;
};

}  // namespace terratile
