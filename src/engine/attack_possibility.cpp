#include "engine/attack_possibility.hpp"

namespace eldor {

AttackPossibility AttackPossibility::evaluate(const CombatUnit& attacker, const CombatUnit& defender,
                                              BattleHex from_hex, bool shooting) {
    AttackPossibility p;
    p.attacker = &attacker;
    p.defender = &defender;
    p.from_hex = from_hex;
    p.is_shooting = shooting;

    const i32 charge = (!shooting && from_hex.is_valid() && from_hex != attacker.position())
        ? BattleHex::distance(attacker.position(), from_hex)
        : 0;

    const AttackContext ctx(attacker, defender, shooting, charge);
    p.damage_to_defender = DamageCalculator(ctx).calculate_damage_range().damage.average();
    p.defender_killed = p.damage_to_defender >= defender.total_health();

    if (!shooting && !p.defender_killed && defender.can_retaliate() && !attacker.no_melee_retaliation()) {
        // Estimated against the defender at full strength
        const DamageEstimation retal = DamageCalculator(ctx.reversed()).calculate_damage_range();
        p.retaliation_damage = retal.damage.average();
        p.attacker_killed = p.retaliation_damage >= attacker.total_health();
    }

    p.score = p.value();
    return p;
}

std::string AttackPossibility::to_string() const {
    std::string result = is_shooting ? "Shoot " : "Attack ";
    if (defender != nullptr) {
        result += defender->name();
    }
    result += ": DMG=" + std::to_string(damage_to_defender) +
              ", RETAL=" + std::to_string(retaliation_damage) +
              ", Score=" + std::to_string(score);
    return result;
}

} // namespace eldor
