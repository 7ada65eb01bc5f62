#pragma once

#include "common.hpp"

#include <cstdint>

namespace realmsim
{
    // Stateless deterministic RNG.
    //
    // Every draw is a pure function of (seed, entity, stream, key, draw), so a replay
    // with the same seed and the same command/timer order produces the same rolls, and
    // no generator state has to live in the world.

    enum class RngStream : std::uint32_t
    {
        Damage = 1,
        Critical = 2,
        Flee = 3,
        FleeExit = 4,
    };

    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
    {
        return splitmix64(a ^ splitmix64(b));
    }

    // Parameters:
    // - seed: global engine seed
    // - entity: the entity the draw is for
    // - stream: separates subsystems so they never share draws
    // - key: per-entity counter identifying the action (swing serial, flee attempt)
    // - draw: draw index within that action (0,1,2...)
    inline std::uint64_t rng_u64(std::uint64_t seed,
                                 EntityId entity,
                                 RngStream stream,
                                 std::uint64_t key,
                                 std::uint32_t draw = 0) noexcept
    {
        std::uint64_t x = seed;
        x = mix_u64(x, static_cast<std::uint64_t>(entity));
        x = mix_u64(x, static_cast<std::uint64_t>(stream));
        x = mix_u64(x, key);
        x = mix_u64(x, static_cast<std::uint64_t>(draw));
        return splitmix64(x);
    }

    // Uniform in [0,1).
    inline double rng_unit_double(std::uint64_t seed,
                                  EntityId entity,
                                  RngStream stream,
                                  std::uint64_t key,
                                  std::uint32_t draw = 0) noexcept
    {
        // Use the top 53 bits to construct a double in [0,1).
        const std::uint64_t r = rng_u64(seed, entity, stream, key, draw);
        const std::uint64_t mantissa = r >> 11;                            // 53 bits
        return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
    }

    // Uniform integer in [lo, hi] (inclusive). Returns lo if hi < lo.
    inline int rng_int_range(std::uint64_t seed,
                             EntityId entity,
                             RngStream stream,
                             std::uint64_t key,
                             int lo,
                             int hi,
                             std::uint32_t draw = 0) noexcept
    {
        if (hi <= lo)
        {
            return lo;
        }
        const std::uint64_t span = static_cast<std::uint64_t>(static_cast<std::int64_t>(hi) - lo) + 1;
        const std::uint64_t r = rng_u64(seed, entity, stream, key, draw);
        // Modulo bias is negligible for dice-sized spans.
        return lo + static_cast<int>(r % span);
    }
}
