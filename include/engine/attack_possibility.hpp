#pragma once

#include "core/types.hpp"
#include "core/combat_unit.hpp"
#include "engine/damage_calculator.hpp"
#include <string>

namespace eldor {

// ==============================================================================
// Attack Possibility - Expected outcome of one hypothetical attack
// ==============================================================================
//
// Uses average damage, (min + max) / 2, for both the strike and the
// retaliation. Nothing is rolled and no unit is modified.
//

struct AttackPossibility {
    static constexpr i32 KILL_BONUS   = 100;
    static constexpr i32 DEATH_PENALTY = 1000;

    const CombatUnit* attacker = nullptr;
    const CombatUnit* defender = nullptr;
    BattleHex from_hex;
    bool is_shooting = false;

    i32 damage_to_defender = 0;
    i32 retaliation_damage = 0;
    bool defender_killed = false;
    bool attacker_killed = false;   // By the retaliation

    i32 score = 0;

    // damage - retaliation, +100 for a kill, -1000 for dying to retaliation
    i32 value() const {
        i64 v = static_cast<i64>(damage_to_defender) - retaliation_damage;
        if (defender_killed) v += KILL_BONUS;
        if (attacker_killed) v -= DEATH_PENALTY;
        return saturate_i32(v);
    }

    static AttackPossibility evaluate(const CombatUnit& attacker, const CombatUnit& defender,
                                      BattleHex from_hex, bool shooting);

    // "Shoot Goblin: DMG=12, RETAL=0, Score=12"
    std::string to_string() const;
};

} // namespace eldor
