#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
//
// One instance drives a whole battle. Every roll (retargeting, hit, crit,
// multi-hit, procs) draws from it sequentially, so the order of draws is part
// of the simulation's reproducibility contract.
struct RNG {
    uint32_t state;

    // xorshift has no zero state: seed 0 runs as 0x12345678 (305419896).
    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    void reseed(uint32_t seed) {
        state = seed ? seed : 0x12345678u;
    }

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    // [0,1)
    double roll() {
        return nextU32() / (static_cast<double>(std::numeric_limits<uint32_t>::max()) + 1.0);
    }

    // p is a fraction (0.25 = 25%). p <= 0 never succeeds and p >= 1 always
    // succeeds; neither consumes a draw.
    bool chance(double p) {
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return roll() < p;
    }

    // Inclusive on both ends.
    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // Index in [0, n-1]. Callers must pass n >= 1; n <= 0 yields 0.
    std::size_t choiceIndex(std::size_t n) {
        if (n <= 1) return 0;
        return static_cast<std::size_t>(nextU32() % static_cast<uint32_t>(n));
    }

    // In-place Fisher-Yates.
    template <typename T>
    void shuffle(std::vector<T>& items) {
        if (items.size() < 2) return;
        for (std::size_t i = items.size() - 1; i > 0; --i) {
            const std::size_t j = choiceIndex(i + 1);
            std::swap(items[i], items[j]);
        }
    }
};

// FNV-1a 64-bit, used for deterministic state fingerprints.
inline uint64_t fnv1a64(const void* data, std::size_t len, uint64_t h = 14695981039346656037ull) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint64_t>(p[i]);
        h *= 1099511628211ull;
    }
    return h;
}
