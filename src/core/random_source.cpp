#include "terratile/core/random_source.hpp"

namespace terratile {

namespace {

/// splitmix64 finalizer; spreads small or zero seeds over the whole state space
uint64_t mixSeed(uint64_t seed) {
    uint64_t h = seed + 0x9e3779b97f4a7c15ULL;
    h = (h ^ (h >> 30)) * 0xbf58476d1ce4e5b9ULL;
    h = (h ^ (h >> 27)) * 0x94d049bb133111ebULL;
    h ^= h >> 31;
    // xorshift state must never be zero
    return h != 0 ? h : 0x517cc1b727220a95ULL;
}

}  // namespace

RandomSource::RandomSource(uint64_t seed) {
    reseed(seed);
}

void RandomSource::reseed(uint64_t seed) {
    seed_ = seed;
    state_ = mixSeed(seed);
}

uint64_t RandomSource::nextU64() {
    // xorshift64*
    state_ ^= state_ >> 12;
    state_ ^= state_ << 25;
    state_ ^= state_ >> 27;
    return state_ * 0x2545f4914f6cdd1dULL;
}

uint32_t RandomSource::nextU32() {
    return static_cast<uint32_t>(nextU64() >> 32);
}

float RandomSource::nextFloat() {
    // Top 24 bits fit a float mantissa exactly, so the result is always < 1
    return static_cast<float>(nextU32() >> 8) * (1.0f / 16777216.0f);
}

int32_t RandomSource::nextInt(int32_t low, int32_t high) {
    if (high <= low) return low;
    uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(high) - low) + 1;
    return static_cast<int32_t>(low + static_cast<int64_t>(nextU64() % span));
}

}  // namespace terratile
