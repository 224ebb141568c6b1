// src/core/Rng.h
#pragma once
#include <cstdint>

namespace promenade::rng {

using Seed = std::uint64_t;

// 64-bit mixing (good for turning IDs into well-scrambled seeds)
inline std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// Derive a child seed from a parent seed and a stable numeric ID
inline Seed derive(Seed parent, std::uint64_t id) {
    return mix64(parent ^ mix64(id));
}

// Minimal PCG32 (XSH-RR). One 64-bit state + 64-bit stream/sequence.
struct Pcg32 {
    std::uint64_t state = 0;
    std::uint64_t inc   = 0; // must be odd

    Pcg32() = default;
    explicit Pcg32(Seed initstate, Seed sequence = 0) { seed(initstate, sequence); }

    void seed(Seed initstate, Seed sequence = 0) {
        state = 0;
        inc   = (mix64(sequence) << 1u) | 1u;
        next_u32();
        state += mix64(initstate);
        next_u32();
    }

    std::uint32_t next_u32() {
        std::uint64_t old = state;
        state = old * 6364136223846793005ull + inc;
        std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        std::uint32_t rot        = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((-static_cast<int>(rot)) & 31));
    }

    // [0,1)
    float next_float01() {
        return (next_u32() >> 8) * (1.0f / 16777216.0f);
    }

    // [lo,hi)
    float uniform(float lo, float hi) {
        return lo + (hi - lo) * next_float01();
    }

    // Uniform on [0, bound) without modulo bias (rejection method); bound > 0
    std::uint32_t next_bounded(std::uint32_t bound) {
        std::uint32_t threshold = static_cast<std::uint32_t>(-bound) % bound;
        for (;;) {
            std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }
};

// One independent stream per subsystem (spawn, replan, jitter).
inline Pcg32 make_rng(Seed parentSeed, std::uint64_t childId, std::uint64_t stream = 0) {
    return Pcg32(derive(parentSeed, childId), stream);
}

} // namespace promenade::rng
