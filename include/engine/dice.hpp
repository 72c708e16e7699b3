#pragma once

#include "core/types.hpp"
#include <array>
#include <utility>

namespace eldor {

// ==============================================================================
// Damage Roller
// Using xoshiro256++ PRNG - fast, seedable, reproducible
// ==============================================================================
//
// One roller is owned by each BattleState and seeded once, so a battle can be
// replayed exactly from its seed.
//

class DiceRoller {
public:
    static constexpr u64 DEFAULT_SEED = 0x853c49e6748fea9bULL;

    explicit DiceRoller(u64 seed = 0) {
        init_state(seed == 0 ? DEFAULT_SEED : seed);
    }

    void seed(u64 s) { init_state(s == 0 ? DEFAULT_SEED : s); }

    // Uniform integer in [min, max] inclusive (bounds are swapped if inverted)
    i32 roll_range(i32 min, i32 max) {
        if (min > max) std::swap(min, max);
        const u64 span = static_cast<u64>(static_cast<i64>(max) - static_cast<i64>(min)) + 1;
        // Lemire reduction on the high 32 bits
        const u64 r = (next() >> 32) * span;
        return static_cast<i32>(static_cast<i64>(min) + static_cast<i64>(r >> 32));
    }

    // Generate raw 64-bit value
    u64 next() {
        const u64 result = rotl(state[0] + state[3], 23) + state[0];

        const u64 t = state[1] << 17;

        state[2] ^= state[0];
        state[3] ^= state[1];
        state[1] ^= state[2];
        state[0] ^= state[3];

        state[2] ^= t;
        state[3] = rotl(state[3], 45);

        return result;
    }

private:
    std::array<u64, 4> state;

    void init_state(u64 seed) {
        // Use splitmix64 to initialize state from seed
        u64 z = seed;
        for (int i = 0; i < 4; ++i) {
            z += 0x9e3779b97f4a7c15ULL;
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            state[i] = z ^ (z >> 31);
        }
    }

    static u64 rotl(u64 x, int k) {
        return (x << k) | (x >> (64 - k));
    }
};

} // namespace eldor
