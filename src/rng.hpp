#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

// SplitMix64 finalizer.
//
// Pinned: seed -> AI threshold mapping and fingerprints depend on it. Changing
// this function changes every recorded replay and needs a trace format bump.
constexpr uint64_t hash64(uint64_t x) {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ull;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebull;
    x ^= x >> 31;
    return x;
}

// Snapshot of an RNG stream (save/replay checkpoints).
struct RNGState {
    uint64_t state = 0;
    uint64_t draws = 0;
};

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
//
// Every encounter owns exactly one of these; all draws (Fate shuffles, enemy
// action rolls, fallback modifiers) consume from it in phase order.
struct RNG {
    uint64_t state;
    uint64_t draws = 0;

    explicit RNG(uint64_t seed = 0x9e3779b97f4a7c15ull)
        : state(seed ? hash64(seed) : 0x9e3779b97f4a7c15ull) {
        if (state == 0) state = 0x9e3779b97f4a7c15ull;
    }

    uint64_t nextU64() {
        // xorshift64*
        uint64_t x = state;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        state = x;
        ++draws;
        return x * 0x2545f4914f6cdd1dull;
    }

    uint32_t nextU32() {
        return static_cast<uint32_t>(nextU64() >> 32);
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    double next01() {
        // [0,1)
        return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
    }

    bool chance(double p) {
        return next01() < p;
    }

    // Fisher-Yates, back to front. Consumes exactly size()-1 draws.
    template <typename T>
    void shuffle(std::vector<T>& v) {
        if (v.size() < 2) return;
        for (std::size_t i = v.size() - 1; i > 0; --i) {
            const std::size_t j = static_cast<std::size_t>(nextU32() % static_cast<uint32_t>(i + 1));
            if (j != i) std::swap(v[i], v[j]);
        }
    }

    RNGState snapshot() const { return RNGState{state, draws}; }

    void restore(const RNGState& s) {
        state = s.state ? s.state : 0x9e3779b97f4a7c15ull;
        draws = s.draws;
    }
};

// Byte-stream FNV-1a for canonical text (fingerprints, content source hash).
inline uint64_t fnv1a64Bytes(const void* data, std::size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    uint64_t h = 14695981039346656037ull;
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint64_t>(p[i]);
        h *= 1099511628211ull;
    }
    return h;
}
