#undef NDEBUG
#include "core/combat_unit.hpp"
#include "core/creature.hpp"
#include "engine/damage_calculator.hpp"
#include "engine/attack_possibility.hpp"
#include <iostream>
#include <cassert>
#include <limits>

using namespace eldor;

static CombatUnit make_unit(const CreatureType& creature, i32 count, BattleSide side,
                            BattleHex pos = BattleHex(5, 5)) {
    return CombatUnit(side == BattleSide::Attacker ? 1 : 2, &creature, count, side, 0, pos);
}

static DamageRange melee_damage(const CombatUnit& attacker, const CombatUnit& defender) {
    return DamageCalculator(AttackContext::melee(attacker, defender)).calculate_damage_range().damage;
}

void test_base_damage_multiplies_by_count() {
    CreatureType archer("Archer", 6, 3, 2, 3, 10, 4);
    CombatUnit attacker = make_unit(archer, 10, BattleSide::Attacker);
    CombatUnit defender = make_unit(archer, 1, BattleSide::Defender);

    DamageCalculator calc(AttackContext::melee(attacker, defender));
    DamageRange base = calc.base_damage_stack();
    assert(base.min == 20);
    assert(base.max == 30);
    std::cout << "[PASS] test_base_damage_multiplies_by_count" << std::endl;
}

void test_inverted_damage_bounds_are_swapped() {
    CreatureType odd("Odd", 5, 5, 4, 2, 10, 4);
    CombatUnit attacker = make_unit(odd, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(odd, 1, BattleSide::Defender);

    DamageRange dmg = melee_damage(attacker, defender);
    assert(dmg.min == 2 && dmg.max == 4);
    std::cout << "[PASS] test_inverted_damage_bounds_are_swapped" << std::endl;
}

void test_equal_attack_and_defense_is_neutral() {
    CreatureType soldier("Soldier", 5, 5, 1, 3, 10, 4);
    CombatUnit attacker = make_unit(soldier, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(soldier, 1, BattleSide::Defender);

    DamageCalculator calc(AttackContext::melee(attacker, defender));
    assert(calc.attack_factor_total() == 1.0);
    assert(calc.defense_factor_total() == 1.0);

    DamageRange dmg = calc.calculate_damage_range().damage;
    assert(dmg.min == 1);
    assert(dmg.max == 3);
    std::cout << "[PASS] test_equal_attack_and_defense_is_neutral" << std::endl;
}

void test_small_defense_edge_reduces_max() {
    // 4 attack into 5 defense: -2.5%, floor(3 x 0.975) = 2
    CreatureType pikeman("Pikeman", 4, 5, 1, 3, 10, 4);
    CombatUnit attacker = make_unit(pikeman, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(pikeman, 1, BattleSide::Defender);

    DamageRange dmg = melee_damage(attacker, defender);
    assert(dmg.min == 1);
    assert(dmg.max == 2);
    std::cout << "[PASS] test_small_defense_edge_reduces_max" << std::endl;
}

void test_attack_cap() {
    CreatureType dragon("Dragon", 100, 1, 10, 10, 100, 20);
    CreatureType peasant("Peasant", 1, 1, 1, 1, 1, 3);
    CombatUnit attacker = make_unit(dragon, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(peasant, 1, BattleSide::Defender);

    DamageCalculator calc(AttackContext::melee(attacker, defender));
    assert(calc.attack_factors()[0] == DamageCalculator::ATTACK_MULTIPLIER_CAP);

    DamageRange dmg = calc.calculate_damage_range().damage;
    assert(dmg.min == 40);
    assert(dmg.max == 40);
    std::cout << "[PASS] test_attack_cap" << std::endl;
}

void test_defense_cap() {
    CreatureType peasant("Peasant", 1, 1, 100, 100, 1, 3);
    CreatureType titan("Titan", 1, 100, 1, 1, 300, 11);
    CombatUnit attacker = make_unit(peasant, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(titan, 1, BattleSide::Defender);

    DamageRange dmg = melee_damage(attacker, defender);
    assert(dmg.min == 30);
    assert(dmg.max == 30);
    std::cout << "[PASS] test_defense_cap" << std::endl;
}

void test_defense_advantage() {
    CreatureType peasant("Peasant", 1, 1, 10, 10, 1, 3);
    CreatureType golem("Golem", 1, 10, 1, 1, 30, 3);
    CombatUnit attacker = make_unit(peasant, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(golem, 1, BattleSide::Defender);

    // 9 points: -22.5%, floor(7.75)
    DamageRange dmg = melee_damage(attacker, defender);
    assert(dmg.min == 7 && dmg.max == 7);
    std::cout << "[PASS] test_defense_advantage" << std::endl;
}

void test_damage_never_below_one() {
    for (i32 atk = 0; atk <= 40; atk += 4) {
        for (i32 def = 0; def <= 60; def += 6) {
            CreatureType a("A", atk, 0, 1, 2, 10, 5);
            CreatureType d("D", 0, def, 1, 1, 10, 5);
            CombatUnit attacker = make_unit(a, 1, BattleSide::Attacker);
            CombatUnit defender = make_unit(d, 1, BattleSide::Defender);

            AttackContext ctx = AttackContext::melee(attacker, defender);
            ctx.unlucky_strike = true;
            DamageRange dmg = DamageCalculator(ctx).calculate_damage_range().damage;
            assert(dmg.min >= 1);
            assert(dmg.max >= dmg.min);
        }
    }
    std::cout << "[PASS] test_damage_never_below_one" << std::endl;
}

void test_ranged_penalty_in_melee() {
    CreatureType archer("Archer", 6, 3, 2, 3, 10, 4, 12);
    CombatUnit attacker = make_unit(archer, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(archer, 1, BattleSide::Defender);

    DamageRange melee = melee_damage(attacker, defender);
    assert(melee.min == 1 && melee.max == 1);

    DamageRange shot = DamageCalculator(AttackContext::shooting(attacker, defender))
        .calculate_damage_range().damage;
    assert(shot.min == 2 && shot.max == 3);

    // Shoot-in-melee creatures skip the penalty
    CreatureType elf("Wood Elf", 6, 3, 2, 3, 15, 7, 24);
    elf.add_ability(Ability::ShootInMelee);
    CombatUnit elf_unit = make_unit(elf, 1, BattleSide::Attacker);
    DamageRange elf_melee = melee_damage(elf_unit, defender);
    assert(elf_melee.min == 2 && elf_melee.max == 3);
    std::cout << "[PASS] test_ranged_penalty_in_melee" << std::endl;
}

void test_luck_factors() {
    CreatureType swordsman("Swordsman", 6, 6, 6, 9, 35, 5);
    CombatUnit attacker = make_unit(swordsman, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(swordsman, 1, BattleSide::Defender);

    AttackContext lucky = AttackContext::melee(attacker, defender);
    lucky.lucky_strike = true;
    DamageRange up = DamageCalculator(lucky).calculate_damage_range().damage;
    assert(up.min == 12 && up.max == 18);

    AttackContext unlucky = AttackContext::melee(attacker, defender);
    unlucky.unlucky_strike = true;
    DamageRange down = DamageCalculator(unlucky).calculate_damage_range().damage;
    assert(down.min == 3 && down.max == 4);
    std::cout << "[PASS] test_luck_factors" << std::endl;
}

void test_attack_factors_are_additive() {
    CreatureType griffin("Griffin", 8, 8, 3, 6, 25, 6);
    CreatureType weak("Weak", 8, 4, 3, 6, 25, 6);
    CombatUnit attacker = make_unit(griffin, 20, BattleSide::Attacker);
    CombatUnit defender = make_unit(weak, 1, BattleSide::Defender);

    // (1 + 0.20 + 1.00) x (60-120)
    AttackContext ctx = AttackContext::melee(attacker, defender);
    ctx.lucky_strike = true;
    DamageRange dmg = DamageCalculator(ctx).calculate_damage_range().damage;
    assert(dmg.min == 132);
    assert(dmg.max == 264);
    std::cout << "[PASS] test_attack_factors_are_additive" << std::endl;
}

void test_defending_unit_takes_less() {
    CreatureType knight("Knight", 10, 10, 10, 10, 50, 5);
    CombatUnit attacker = make_unit(knight, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(knight, 1, BattleSide::Defender);

    assert(melee_damage(attacker, defender).min == 10);
    defender.set_defending(true);
    // Defense 15: 5 points, -12.5%
    assert(melee_damage(attacker, defender).min == 8);
    std::cout << "[PASS] test_defending_unit_takes_less" << std::endl;
}

void test_unimplemented_hooks_are_zero() {
    CreatureType soldier("Soldier", 5, 5, 1, 3, 10, 4);
    CombatUnit attacker = make_unit(soldier, 1, BattleSide::Attacker);
    CombatUnit defender = make_unit(soldier, 1, BattleSide::Defender);

    DamageCalculator calc(AttackContext::melee(attacker, defender, 5));
    for (f64 f : calc.attack_factors()) assert(f == 0.0);
    for (f64 f : calc.defense_factors()) assert(f == 0.0);
    std::cout << "[PASS] test_unimplemented_hooks_are_zero" << std::endl;
}

void test_casualty_rule() {
    // Lead creature at 6 of 10 hp, 5 creatures
    assert(casualties_from_damage(5, 6, 10, 5) == 0);
    assert(casualties_from_damage(6, 6, 10, 5) == 1);
    assert(casualties_from_damage(15, 6, 10, 5) == 1);
    assert(casualties_from_damage(16, 6, 10, 5) == 2);
    assert(casualties_from_damage(26, 6, 10, 5) == 3);
    assert(casualties_from_damage(1000, 6, 10, 5) == 5);
    assert(casualties_from_damage(50, 6, 10, 0) == 0);
    std::cout << "[PASS] test_casualty_rule" << std::endl;
}

void test_kill_range() {
    CreatureType ogre("Ogre", 10, 10, 10, 20, 40, 4);
    CreatureType goblin("Goblin", 10, 10, 1, 1, 5, 5);
    CombatUnit attacker = make_unit(ogre, 2, BattleSide::Attacker);
    CombatUnit defender = make_unit(goblin, 20, BattleSide::Defender);

    DamageEstimation est = DamageCalculator(AttackContext::melee(attacker, defender))
        .calculate_damage_range();
    assert(est.damage.min == 20 && est.damage.max == 40);
    assert(est.kills.min == 4 && est.kills.max == 8);
    std::cout << "[PASS] test_kill_range" << std::endl;
}

void test_casualties_match_applied_damage() {
    CreatureType troll("Troll", 5, 5, 1, 1, 13, 5);

    for (i32 pre = 0; pre < 13; ++pre) {
        for (i32 damage = 1; damage < 200; damage += 3) {
            CombatUnit defender = make_unit(troll, 9, BattleSide::Defender);
            defender.take_damage(pre);
            CombatUnit attacker = make_unit(troll, 1, BattleSide::Attacker);

            const i32 before = defender.count();
            const i32 predicted = DamageCalculator(AttackContext::melee(attacker, defender)).casualties(damage);
            defender.take_damage(damage);
            assert(predicted == before - defender.count());
        }
    }
    std::cout << "[PASS] test_casualties_match_applied_damage" << std::endl;
}

void test_reversed_context() {
    CreatureType soldier("Soldier", 5, 5, 1, 3, 10, 4);
    CombatUnit attacker = make_unit(soldier, 1, BattleSide::Attacker, BattleHex(3, 3));
    CombatUnit defender = make_unit(soldier, 1, BattleSide::Defender, BattleHex(4, 3));

    AttackContext ctx = AttackContext::melee(attacker, defender, 4);
    AttackContext rev = ctx.reversed();
    assert(rev.attacker == &defender);
    assert(rev.defender == &attacker);
    assert(rev.attacker_pos == BattleHex(4, 3));
    assert(rev.defender_pos == BattleHex(3, 3));
    assert(!rev.is_shooting);
    assert(rev.charge_distance == 0);
    std::cout << "[PASS] test_reversed_context" << std::endl;
}

void test_limit_sized_stacks_stay_exact() {
    CreatureType giant("Giant", 70, 10, 9999, 9999, MAX_CREATURE_HP, 7);
    CreatureType wall("Wall", 0, 10, 1, 1, 10, 1);
    CombatUnit attacker = make_unit(giant, MAX_STACK_COUNT, BattleSide::Attacker);
    CombatUnit defender = make_unit(wall, 10, BattleSide::Defender, BattleHex(6, 5));

    assert(attacker.total_health() == 999'890'001);

    // +300% skill cap and +100% luck
    AttackContext ctx = AttackContext::melee(attacker, defender);
    ctx.lucky_strike = true;
    const DamageRange damage = DamageCalculator(ctx).calculate_damage_range().damage;
    assert(damage.min == 499'900'005);
    assert(damage.max == 499'900'005);
    std::cout << "[PASS] test_limit_sized_stacks_stay_exact" << std::endl;
}

void test_oversized_stacks_saturate() {
    constexpr i32 I32_MAX = std::numeric_limits<i32>::max();
    CreatureType giant("Giant", 10, 10, 9999, 9999, 99999, 7);
    CreatureType peasant("Peasant", 10, 10, 1, 1, 10, 3);
    CombatUnit horde = make_unit(giant, 999'999'999, BattleSide::Attacker);
    CombatUnit target = make_unit(peasant, 5, BattleSide::Defender, BattleHex(6, 5));

    assert(horde.total_health() == I32_MAX);

    DamageCalculator calc(AttackContext::melee(horde, target));
    const DamageRange base = calc.base_damage_stack();
    assert(base.min == I32_MAX && base.max == I32_MAX);

    const DamageEstimation est = calc.calculate_damage_range();
    assert(est.damage.min == I32_MAX);
    assert(est.damage.max == I32_MAX);
    assert(est.damage.average() == I32_MAX);
    assert(est.kills.min == 5 && est.kills.max == 5);

    const AttackPossibility p = AttackPossibility::evaluate(horde, target, horde.position(), false);
    assert(p.defender_killed);
    assert(p.score == I32_MAX);

    // A huge hit on a huge stack removes whole creatures without looping
    CombatUnit mob = make_unit(peasant, 999'999'999, BattleSide::Defender);
    assert(mob.total_health() == I32_MAX);
    mob.take_damage(I32_MAX);
    assert(mob.count() == 785'251'635);
    assert(mob.first_unit_hp() == 3);
    std::cout << "[PASS] test_oversized_stacks_saturate" << std::endl;
}

int main() {
    std::cout << "=== Damage Calculator Tests ===" << std::endl;

    test_base_damage_multiplies_by_count();
    test_inverted_damage_bounds_are_swapped();
    test_equal_attack_and_defense_is_neutral();
    test_small_defense_edge_reduces_max();
    test_attack_cap();
    test_defense_cap();
    test_defense_advantage();
    test_damage_never_below_one();
    test_ranged_penalty_in_melee();
    test_luck_factors();
    test_attack_factors_are_additive();
    test_defending_unit_takes_less();
    test_unimplemented_hooks_are_zero();
    test_casualty_rule();
    test_kill_range();
    test_casualties_match_applied_damage();
    test_reversed_context();
    test_limit_sized_stacks_stay_exact();
    test_oversized_stacks_saturate();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
