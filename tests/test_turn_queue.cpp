#undef NDEBUG
#include "core/combat_unit.hpp"
#include "core/creature.hpp"
#include "engine/turn_queue.hpp"
#include <iostream>
#include <cassert>
#include <vector>

using namespace eldor;

static std::vector<const CombatUnit*> pointers(const std::vector<CombatUnit>& units) {
    std::vector<const CombatUnit*> out;
    for (const auto& unit : units) out.push_back(&unit);
    return out;
}

void test_speed_order() {
    CreatureType fast("Fast", 5, 5, 1, 2, 10, 10);
    CreatureType medium("Medium", 5, 5, 1, 2, 10, 7);
    CreatureType slow("Slow", 5, 5, 1, 2, 10, 4);

    std::vector<CombatUnit> units;
    units.emplace_back(0, &slow, 5, BattleSide::Attacker, 0, BattleHex(1, 4));
    units.emplace_back(1, &fast, 5, BattleSide::Defender, 0, BattleHex(15, 4));
    units.emplace_back(2, &medium, 5, BattleSide::Attacker, 1, BattleHex(1, 5));

    TurnQueue queue;
    queue.build_queue(pointers(units), 1);
    assert(queue.current_round() == 1);
    assert(queue.remaining() == 3);
    assert(queue.peek_next_unit() == 1);

    assert(queue.get_next_unit() == 1);
    assert(queue.get_next_unit() == 2);
    assert(queue.get_next_unit() == 0);
    assert(queue.get_next_unit() == INVALID_UNIT);
    assert(queue.empty());
    assert(queue.peek_next_unit() == INVALID_UNIT);
    std::cout << "[PASS] test_speed_order" << std::endl;
}

void test_dead_and_waited_units_excluded() {
    CreatureType soldier("Soldier", 5, 5, 1, 2, 10, 5);

    std::vector<CombatUnit> units;
    units.emplace_back(0, &soldier, 5, BattleSide::Attacker, 0, BattleHex(1, 4));
    units.emplace_back(1, &soldier, 5, BattleSide::Attacker, 1, BattleHex(1, 5));
    units.emplace_back(2, &soldier, 5, BattleSide::Defender, 0, BattleHex(15, 4));
    units[0].take_damage(1000);
    units[1].set_waited(true);

    TurnQueue queue;
    std::vector<const CombatUnit*> ptrs = pointers(units);
    ptrs.push_back(nullptr);
    queue.build_queue(ptrs, 1);
    assert(queue.turn_order() == std::vector<UnitId>{2});
    std::cout << "[PASS] test_dead_and_waited_units_excluded" << std::endl;
}

void test_wait_moves_unit_behind_normal_phase() {
    CreatureType fast("Fast", 5, 5, 1, 2, 10, 10);
    CreatureType medium("Medium", 5, 5, 1, 2, 10, 7);
    CreatureType slow("Slow", 5, 5, 1, 2, 10, 4);
    CreatureType crawler("Crawler", 5, 5, 1, 2, 10, 2);

    std::vector<CombatUnit> units;
    units.emplace_back(0, &fast, 5, BattleSide::Attacker, 0, BattleHex(1, 4));
    units.emplace_back(1, &medium, 5, BattleSide::Defender, 0, BattleHex(15, 4));
    units.emplace_back(2, &slow, 5, BattleSide::Attacker, 1, BattleHex(1, 5));
    units.emplace_back(3, &crawler, 5, BattleSide::Defender, 1, BattleHex(15, 5));

    TurnQueue queue;
    queue.build_queue(pointers(units), 1);

    // The fastest unit waits first, then the medium one
    queue.move_to_wait_phase(0, units[0]);
    assert(units[0].has_waited());
    assert(queue.current_phase() == TurnPhase::Normal);
    assert(queue.get_next_unit() == 1);

    queue.move_to_wait_phase(2, units[2]);
    assert(queue.turn_order() == (std::vector<UnitId>{3, 0, 2}));

    assert(queue.get_next_unit() == 3);
    assert(queue.current_phase() == TurnPhase::WaitedEligibleForMorale);
    assert(queue.get_next_unit() == 0);
    assert(queue.get_next_unit() == 2);
    assert(queue.empty());
    std::cout << "[PASS] test_wait_moves_unit_behind_normal_phase" << std::endl;
}

void test_no_morale_phase_is_last() {
    CreatureType soldier("Soldier", 5, 5, 1, 2, 10, 5);
    CreatureType slow("Slow", 5, 5, 1, 2, 10, 3);

    std::vector<CombatUnit> units;
    units.emplace_back(0, &soldier, 5, BattleSide::Attacker, 0, BattleHex(1, 4));
    units.emplace_back(1, &soldier, 5, BattleSide::Attacker, 1, BattleHex(1, 5));
    units.emplace_back(2, &slow, 5, BattleSide::Defender, 0, BattleHex(15, 4));

    TurnQueue queue;
    queue.build_queue(pointers(units), 1);
    queue.move_to_wait_phase(0, units[0]);
    queue.move_to_wait_phase(1, units[1]);
    queue.move_to_wait_phase_no_morale(0);
    queue.move_to_wait_phase_no_morale(42);

    assert(queue.turn_order() == (std::vector<UnitId>{2, 1, 0}));
    assert(queue.entries().back().phase == TurnPhase::WaitedNoMorale);
    std::cout << "[PASS] test_no_morale_phase_is_last" << std::endl;
}

void test_equal_speed_alternates_sides() {
    CreatureType soldier("Soldier", 5, 5, 1, 2, 10, 5);

    std::vector<CombatUnit> units;
    units.emplace_back(0, &soldier, 5, BattleSide::Defender, 0, BattleHex(15, 4));
    units.emplace_back(1, &soldier, 5, BattleSide::Defender, 1, BattleHex(15, 5));
    units.emplace_back(2, &soldier, 5, BattleSide::Attacker, 1, BattleHex(1, 5));
    units.emplace_back(3, &soldier, 5, BattleSide::Attacker, 0, BattleHex(1, 4));

    TurnQueue queue;
    queue.build_queue(pointers(units), 1);
    assert(!queue.last_active_side().has_value());

    // Attacker first when nobody has acted, slot order within a side
    assert(queue.get_next_unit() == 3);
    assert(queue.last_active_side() == BattleSide::Attacker);
    assert(queue.get_next_unit() == 0);
    assert(queue.get_next_unit() == 2);
    assert(queue.get_next_unit() == 1);
    std::cout << "[PASS] test_equal_speed_alternates_sides" << std::endl;
}

void test_bonus_turn_goes_first() {
    CreatureType fast("Fast", 5, 5, 1, 2, 10, 10);
    CreatureType slow("Slow", 5, 5, 1, 2, 10, 4);

    std::vector<CombatUnit> units;
    units.emplace_back(0, &fast, 5, BattleSide::Attacker, 0, BattleHex(1, 4));
    units.emplace_back(1, &fast, 5, BattleSide::Defender, 0, BattleHex(15, 4));
    units.emplace_back(2, &slow, 5, BattleSide::Attacker, 1, BattleHex(1, 5));

    TurnQueue queue;
    queue.build_queue(pointers(units), 1);
    assert(queue.get_next_unit() == 0);

    // Good morale after acting: the same unit goes again ahead of the faster enemy
    queue.insert_bonus_turn(0, units[0]);
    assert(queue.peek_next_unit() == 0);
    assert(queue.remaining() == 3);
    assert(queue.get_next_unit() == 0);
    assert(queue.get_next_unit() == 1);
    std::cout << "[PASS] test_bonus_turn_goes_first" << std::endl;
}

void test_remove_unit() {
    CreatureType soldier("Soldier", 5, 5, 1, 2, 10, 5);

    std::vector<CombatUnit> units;
    units.emplace_back(0, &soldier, 5, BattleSide::Attacker, 0, BattleHex(1, 4));
    units.emplace_back(1, &soldier, 5, BattleSide::Defender, 0, BattleHex(15, 4));

    TurnQueue queue;
    queue.build_queue(pointers(units), 3);
    assert(queue.remove_unit(0));
    assert(!queue.remove_unit(0));
    assert(queue.turn_order() == std::vector<UnitId>{1});
    assert(queue.get_next_unit() == 1);
    assert(queue.get_next_unit() == INVALID_UNIT);
    std::cout << "[PASS] test_remove_unit" << std::endl;
}

void test_rebuild_resets_round() {
    CreatureType soldier("Soldier", 5, 5, 1, 2, 10, 5);

    std::vector<CombatUnit> units;
    units.emplace_back(0, &soldier, 5, BattleSide::Attacker, 0, BattleHex(1, 4));

    TurnQueue queue;
    queue.build_queue(pointers(units), 1);
    queue.move_to_wait_phase(0, units[0]);
    assert(queue.current_phase() == TurnPhase::WaitedEligibleForMorale);

    units[0].start_turn();
    queue.build_queue(pointers(units), 2);
    assert(queue.current_round() == 2);
    assert(queue.current_phase() == TurnPhase::Normal);
    assert(queue.remaining() == 1);
    std::cout << "[PASS] test_rebuild_resets_round" << std::endl;
}

int main() {
    std::cout << "=== Turn Queue Tests ===" << std::endl;

    test_speed_order();
    test_dead_and_waited_units_excluded();
    test_wait_moves_unit_behind_normal_phase();
    test_no_morale_phase_is_last();
    test_equal_speed_alternates_sides();
    test_bonus_turn_goes_first();
    test_remove_unit();
    test_rebuild_resets_round();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
