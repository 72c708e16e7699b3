#include "engine/damage_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace eldor {

namespace {

// floor(), then clamped to [1, i32 max]
i32 floor_damage(f64 damage) {
    const f64 floored = std::floor(damage);
    if (!(floored >= 1.0)) return 1;
    if (floored >= static_cast<f64>(std::numeric_limits<i32>::max())) {
        return std::numeric_limits<i32>::max();
    }
    return static_cast<i32>(floored);
}

} // namespace

i32 casualties_from_damage(i32 damage, i32 first_unit_hp, i32 max_health, i32 count) {
    if (count <= 0 || damage < first_unit_hp) return 0;
    if (max_health <= 0) return count;

    const i32 damage_left = damage - first_unit_hp;
    return std::min(1 + damage_left / max_health, count);
}

// ==============================================================================
// Main entry point
// ==============================================================================

DamageEstimation DamageCalculator::calculate_damage_range() const {
    const DamageRange base = base_damage_stack();
    const f64 resulting_factor = attack_factor_total() * defense_factor_total();

    DamageEstimation estimation;
    estimation.damage = DamageRange(
        floor_damage(base.min * resulting_factor),
        floor_damage(base.max * resulting_factor)
    );
    estimation.kills = casualties(estimation.damage);
    return estimation;
}

f64 DamageCalculator::attack_factor_total() const {
    f64 total = 1.0;
    for (f64 factor : attack_factors()) {
        total += factor;
    }
    return total;
}

f64 DamageCalculator::defense_factor_total() const {
    f64 total = 1.0;
    for (f64 factor : defense_factors()) {
        total *= (1.0 - std::min(1.0, factor));
    }
    return total;
}

std::array<f64, DamageCalculator::ATTACK_FACTOR_COUNT> DamageCalculator::attack_factors() const {
    return {
        attack_skill_factor(),
        attack_offense_archery_factor(),
        attack_bless_factor(),
        attack_luck_factor(),
        attack_jousting_factor(),
        attack_from_back_factor(),
        attack_death_blow_factor(),
        attack_double_damage_factor(),
        attack_hate_factor()
    };
}

std::array<f64, DamageCalculator::DEFENSE_FACTOR_COUNT> DamageCalculator::defense_factors() const {
    return {
        defense_skill_factor(),
        defense_armorer_factor(),
        defense_magic_shield_factor(),
        defense_range_penalty_factor(),
        defense_obstacle_factor(),
        defense_unlucky_factor()
    };
}

// ==============================================================================
// Base damage
// ==============================================================================

DamageRange DamageCalculator::base_damage_single() const {
    i32 lo = ctx_.attacker->min_damage();
    i32 hi = ctx_.attacker->max_damage();
    if (lo > hi) std::swap(lo, hi);
    return DamageRange(lo, hi);
}

// Bless (always max) and curse (always min) hook in here once spells exist
DamageRange DamageCalculator::base_damage_bless_curse() const {
    return base_damage_single();
}

DamageRange DamageCalculator::base_damage_stack() const {
    const i64 stack_size = ctx_.attacker->count();
    const DamageRange single = base_damage_bless_curse();
    return DamageRange(saturate_i32(single.min * stack_size), saturate_i32(single.max * stack_size));
}

// ==============================================================================
// Attack factors (additive)
// ==============================================================================

f64 DamageCalculator::attack_skill_factor() const {
    const i32 advantage = actor_attack() - target_defense();
    if (advantage <= 0) return 0.0;
    return std::min(ATTACK_MULTIPLIER * advantage, ATTACK_MULTIPLIER_CAP);
}

// Offense (melee) / Archery (ranged) hero skills
f64 DamageCalculator::attack_offense_archery_factor() const {
    return 0.0;
}

f64 DamageCalculator::attack_bless_factor() const {
    return 0.0;
}

f64 DamageCalculator::attack_luck_factor() const {
    return ctx_.lucky_strike ? 1.0 : 0.0;
}

// Jousting creatures: +5% per hex charged
f64 DamageCalculator::attack_jousting_factor() const {
    return 0.0;
}

f64 DamageCalculator::attack_from_back_factor() const {
    return 0.0;
}

f64 DamageCalculator::attack_death_blow_factor() const {
    return ctx_.death_blow ? 1.0 : 0.0;
}

f64 DamageCalculator::attack_double_damage_factor() const {
    return ctx_.double_damage ? 1.0 : 0.0;
}

f64 DamageCalculator::attack_hate_factor() const {
    return 0.0;
}

// ==============================================================================
// Defense factors (multiplicative)
// ==============================================================================

f64 DamageCalculator::defense_skill_factor() const {
    const i32 advantage = target_defense() - actor_attack();
    if (advantage <= 0) return 0.0;
    return std::min(DEFENSE_MULTIPLIER * advantage, DEFENSE_MULTIPLIER_CAP);
}

f64 DamageCalculator::defense_armorer_factor() const {
    return 0.0;
}

f64 DamageCalculator::defense_magic_shield_factor() const {
    return 0.0;
}

f64 DamageCalculator::defense_range_penalty_factor() const {
    if (ctx_.is_shooting) {
        // Long-range falloff not modelled yet
        return 0.0;
    }
    if (ctx_.attacker->is_ranged() && !ctx_.attacker->can_shoot_in_melee()) {
        return RANGE_PENALTY;
    }
    return 0.0;
}

f64 DamageCalculator::defense_obstacle_factor() const {
    return 0.0;
}

f64 DamageCalculator::defense_unlucky_factor() const {
    return ctx_.unlucky_strike ? UNLUCKY_PENALTY : 0.0;
}

// ==============================================================================
// Casualties
// ==============================================================================

i32 DamageCalculator::casualties(i32 damage) const {
    const CombatUnit& def = *ctx_.defender;
    return casualties_from_damage(damage, def.first_unit_hp(), def.max_health(), def.count());
}

DamageRange DamageCalculator::casualties(const DamageRange& damage) const {
    return DamageRange(casualties(damage.min), casualties(damage.max));
}

} // namespace eldor
