#pragma once

#include "core/types.hpp"
#include "core/combat_unit.hpp"
#include "core/hex.hpp"
#include <array>
#include <string>

namespace eldor {

// ==============================================================================
// Damage Structures
// ==============================================================================

struct DamageRange {
    i32 min = 0;
    i32 max = 0;

    DamageRange() = default;
    DamageRange(i32 lo, i32 hi) : min(lo), max(hi) {}

    i32 average() const { return static_cast<i32>((static_cast<i64>(min) + max) / 2); }
    std::string to_string() const { return std::to_string(min) + "-" + std::to_string(max); }
};

struct DamageEstimation {
    DamageRange damage;
    DamageRange kills;

    std::string to_string() const {
        return "Damage: " + damage.to_string() + ", Kills: " + kills.to_string();
    }
};

// ==============================================================================
// Attack Context - All parameters for a single attack resolution
// ==============================================================================
//
// Luck, death blow and double damage are set by callers once the morale/luck
// and creature-specialty systems exist; the engine leaves them false.
//

struct AttackContext {
    const CombatUnit* attacker;
    const CombatUnit* defender;
    BattleHex attacker_pos;
    BattleHex defender_pos;

    bool is_shooting     = false;
    i32  charge_distance = 0;     // Hexes moved before a melee hit
    bool lucky_strike    = false;
    bool unlucky_strike  = false;
    bool death_blow      = false;
    bool double_damage   = false;

    AttackContext(const CombatUnit& atk, const CombatUnit& def,
                  bool shooting = false, i32 charge = 0)
        : attacker(&atk), defender(&def),
          attacker_pos(atk.position()), defender_pos(def.position()),
          is_shooting(shooting), charge_distance(charge) {}

    static AttackContext melee(const CombatUnit& atk, const CombatUnit& def, i32 charge = 0) {
        return AttackContext(atk, def, false, charge);
    }

    static AttackContext shooting(const CombatUnit& atk, const CombatUnit& def) {
        return AttackContext(atk, def, true, 0);
    }

    // Retaliation: roles swapped, always melee, no charge
    AttackContext reversed() const {
        AttackContext ctx(*defender, *attacker, false, 0);
        ctx.attacker_pos = defender_pos;
        ctx.defender_pos = attacker_pos;
        return ctx;
    }
};

// Creatures killed by `damage` against a stack with the given health state.
// The partially damaged lead creature dies first, then whole creatures.
i32 casualties_from_damage(i32 damage, i32 first_unit_hp, i32 max_health, i32 count);

// ==============================================================================
// Damage Calculator
// ==============================================================================
//
//   base   = creature min-max damage x stack count
//   attack = 1 + sum(attack factors)          (additive bonuses)
//   defend = prod(1 - min(1, defense factor))  (multiplicative reductions)
//   final  = max(1, floor(base x attack x defend)), per bound
//

class DamageCalculator {
public:
    static constexpr f64 ATTACK_MULTIPLIER      = 0.05;   // 5% per attack point
    static constexpr f64 ATTACK_MULTIPLIER_CAP  = 3.0;    // +300% at 60 points
    static constexpr f64 DEFENSE_MULTIPLIER     = 0.025;  // 2.5% per defense point
    static constexpr f64 DEFENSE_MULTIPLIER_CAP = 0.7;    // -70% at 28 points
    static constexpr f64 RANGE_PENALTY          = 0.5;
    static constexpr f64 UNLUCKY_PENALTY        = 0.5;

    static constexpr size_t ATTACK_FACTOR_COUNT  = 9;
    static constexpr size_t DEFENSE_FACTOR_COUNT = 6;

    explicit DamageCalculator(const AttackContext& ctx) : ctx_(ctx) {}

    DamageEstimation calculate_damage_range() const;

    // Kills for a specific damage amount against the defender's current state
    i32 casualties(i32 damage) const;
    DamageRange casualties(const DamageRange& damage) const;

    DamageRange base_damage_stack() const;
    f64 attack_factor_total() const;
    f64 defense_factor_total() const;

    std::array<f64, ATTACK_FACTOR_COUNT> attack_factors() const;
    std::array<f64, DEFENSE_FACTOR_COUNT> defense_factors() const;

private:
    AttackContext ctx_;

    DamageRange base_damage_single() const;
    DamageRange base_damage_bless_curse() const;

    i32 actor_attack() const { return ctx_.attacker->attack(); }
    i32 target_defense() const { return ctx_.defender->defense(); }

    // Attack factors
    f64 attack_skill_factor() const;
    f64 attack_offense_archery_factor() const;
    f64 attack_bless_factor() const;
    f64 attack_luck_factor() const;
    f64 attack_jousting_factor() const;
    f64 attack_from_back_factor() const;
    f64 attack_death_blow_factor() const;
    f64 attack_double_damage_factor() const;
    f64 attack_hate_factor() const;

    // Defense factors
    f64 defense_skill_factor() const;
    f64 defense_armorer_factor() const;
    f64 defense_magic_shield_factor() const;
    f64 defense_range_penalty_factor() const;
    f64 defense_obstacle_factor() const;
    f64 defense_unlucky_factor() const;
};

} // namespace eldor
