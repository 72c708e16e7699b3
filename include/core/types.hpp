#pragma once

#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <array>
#include <limits>
#include <string>
#include <string_view>

namespace eldor {

// ==============================================================================
// Fundamental Types
// ==============================================================================

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;

// Unit ids are allocated by BattleState and never reused within a battle
using UnitId = i32;
constexpr UnitId INVALID_UNIT = -1;

// Battlefield and army limits (compile-time constants)
constexpr i32 FIELD_WIDTH          = 17;
constexpr i32 FIELD_HEIGHT         = 11;
constexpr i32 FIELD_SIZE           = FIELD_WIDTH * FIELD_HEIGHT;  // 187
constexpr i32 ARMY_SLOTS           = 7;
constexpr i32 RETALIATIONS_PER_TURN = 1;
constexpr size_t MAX_NAME_LENGTH   = 64;

// Creature and stack limits accepted from creature tables and rosters.
// 9999 x 99999 HP and 9999 x 9999 damage (x7 factor) stay inside i32.
constexpr i32 MAX_STACK_COUNT      = 9999;
constexpr i32 MAX_CREATURE_DAMAGE  = 9999;
constexpr i32 MAX_CREATURE_HP      = 99999;

// Narrows a 64-bit amount onto the i32 range
inline constexpr i32 saturate_i32(i64 value) {
    return static_cast<i32>(std::clamp<i64>(value, std::numeric_limits<i32>::min(),
                                            std::numeric_limits<i32>::max()));
}

// ==============================================================================
// Enumerations
// ==============================================================================

enum class BattleSide : u8 {
    Attacker = 0,
    Defender = 1
};

inline constexpr BattleSide opposite(BattleSide side) {
    return side == BattleSide::Attacker ? BattleSide::Defender : BattleSide::Attacker;
}

inline constexpr size_t side_index(BattleSide side) {
    return static_cast<size_t>(side);
}

// Units in earlier phases act before units in later phases
enum class TurnPhase : u8 {
    Normal                  = 0,  // Regular turns
    WaitedEligibleForMorale = 1,  // Waited, morale check still pending
    WaitedNoMorale          = 2   // Waited, no morale eligibility
};

enum class BattlePhase : u8 {
    NotStarted = 0,
    Tactics    = 1,  // Pre-battle repositioning (not used yet)
    Normal     = 2,
    Ended      = 3
};

enum class BattleFieldType : u8 {
    Grass = 0,
    Dirt,
    Sand,
    Snow,
    Swamp,
    Rough,
    Cave,
    Lava
};

enum class StatType : u8 {
    Attack  = 0,
    Defense = 1,
    Speed   = 2
};

inline constexpr const char* to_string(BattleSide side) {
    return side == BattleSide::Attacker ? "Attacker" : "Defender";
}

inline constexpr const char* to_string(TurnPhase phase) {
    switch (phase) {
        case TurnPhase::Normal: return "Normal";
        case TurnPhase::WaitedEligibleForMorale: return "WaitedEligibleForMorale";
        case TurnPhase::WaitedNoMorale: return "WaitedNoMorale";
    }
    return "Unknown";
}

inline constexpr const char* to_string(BattlePhase phase) {
    switch (phase) {
        case BattlePhase::NotStarted: return "NotStarted";
        case BattlePhase::Tactics: return "Tactics";
        case BattlePhase::Normal: return "Normal";
        case BattlePhase::Ended: return "Ended";
    }
    return "Unknown";
}

inline constexpr const char* to_string(BattleFieldType type) {
    switch (type) {
        case BattleFieldType::Grass: return "Grass";
        case BattleFieldType::Dirt: return "Dirt";
        case BattleFieldType::Sand: return "Sand";
        case BattleFieldType::Snow: return "Snow";
        case BattleFieldType::Swamp: return "Swamp";
        case BattleFieldType::Rough: return "Rough";
        case BattleFieldType::Cave: return "Cave";
        case BattleFieldType::Lava: return "Lava";
    }
    return "Unknown";
}

// ==============================================================================
// Fixed-Size String (avoids heap allocation)
// ==============================================================================

template<size_t N>
struct FixedString {
    std::array<char, N> data{};
    u8 length = 0;

    FixedString() = default;

    FixedString(std::string_view sv) {
        length = static_cast<u8>(std::min(sv.size(), N - 1));
        std::copy_n(sv.begin(), length, data.begin());
        data[length] = '\0';
    }

    std::string_view view() const { return {data.data(), length}; }
    const char* c_str() const { return data.data(); }
    bool empty() const { return length == 0; }

    bool operator==(const FixedString& other) const { return view() == other.view(); }
};

using Name = FixedString<MAX_NAME_LENGTH>;

} // namespace eldor
