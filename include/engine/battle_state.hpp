#pragma once

#include "core/types.hpp"
#include "core/hex.hpp"
#include "core/army.hpp"
#include "core/creature.hpp"
#include "core/combat_unit.hpp"
#include "engine/dice.hpp"
#include "engine/damage_calculator.hpp"
#include "engine/turn_queue.hpp"
#include "engine/battle_action.hpp"
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace eldor {

// ==============================================================================
// Battlefield Data
// ==============================================================================

struct BattleObstacle {
    Name name;
    bool blocks_movement = true;
    bool blocks_ranged   = false;

    BattleObstacle() = default;
    explicit BattleObstacle(std::string_view obstacle_name,
                            bool movement = true, bool ranged = false)
        : name(obstacle_name), blocks_movement(movement), blocks_ranged(ranged) {}
};

// Per-side bookkeeping (heroes are not modelled, only their roster)
struct BattleSideInfo {
    BattleSide side = BattleSide::Attacker;
    Army army;
    i32 spells_cast_this_round = 0;
    bool has_retreated = false;

    void start_new_round() { spells_cast_this_round = 0; }
};

// ==============================================================================
// Attack Result
// ==============================================================================

struct AttackResult {
    UnitId attacker_id = INVALID_UNIT;
    UnitId defender_id = INVALID_UNIT;
    Name attacker_name;
    Name defender_name;
    i32 damage_dealt = 0;
    i32 kills_dealt  = 0;
    bool is_killed   = false;   // Defender stack destroyed
    bool is_shooting = false;

    // Never nested deeper than one level
    std::unique_ptr<AttackResult> retaliation;

    bool has_retaliation() const { return retaliation != nullptr; }

    // "Archer Shot Goblin for 14 damage (2 killed)"
    std::string to_string() const;
};

struct ActionResult {
    bool executed = false;
    std::vector<AttackResult> attacks;   // Two entries for double attackers
};

// ==============================================================================
// Battle State - Owns every unit, the turn queue and the battle outcome
// ==============================================================================
//
// Units are stored by id and never reallocated, so CombatUnit pointers handed
// out stay valid until remove_dead_units() erases the dead ones.
//

class BattleState {
public:
    explicit BattleState(u64 seed = 0);
    BattleState(const Army& attacker, const Army& defender, u64 seed = 0);

    // ==========================================================================
    // Setup
    // ==========================================================================

    // nullptr when creature is null or count <= 0
    CombatUnit* add_unit(const CreatureType* creature, i32 count, BattleSide side,
                         i32 slot_index, BattleHex position);

    // Places every non-empty roster slot. Returns the number of stacks placed.
    i32 deploy_armies(const CreatureTable& creatures);

    // Attacker fills columns 1-3 left to right, defender columns 15-13
    // right to left, three slots per column on rows 4-6.
    static BattleHex starting_position(BattleSide side, i32 slot_index);

    void add_obstacle(BattleHex hex, BattleObstacle obstacle);
    const BattleObstacle* obstacle_at(BattleHex hex) const;

    BattleFieldType field_type() const { return field_type_; }
    void set_field_type(BattleFieldType type) { field_type_ = type; }

    // ==========================================================================
    // Unit queries
    // ==========================================================================

    CombatUnit* unit(UnitId id);
    const CombatUnit* unit(UnitId id) const;

    std::vector<CombatUnit*> all_units();
    std::vector<const CombatUnit*> all_units() const;

    // Living units only
    std::vector<CombatUnit*> units_for_side(BattleSide side);
    std::vector<const CombatUnit*> units_for_side(BattleSide side) const;
    i32 living_count(BattleSide side) const;

    CombatUnit* unit_at(BattleHex hex);
    const CombatUnit* unit_at(BattleHex hex) const;

    size_t unit_count() const { return units_.size(); }

    // Returns the number of entries erased
    i32 remove_dead_units();

    // ==========================================================================
    // Rounds and turns
    // ==========================================================================

    void start_new_round();

    // Dequeues and activates the next living unit; nullptr when the round is over
    CombatUnit* get_next_unit();
    CombatUnit* peek_next_unit();

    CombatUnit* active_unit();
    UnitId active_unit_id() const { return active_unit_id_; }
    void set_active_unit(UnitId id) { active_unit_id_ = id; }

    bool has_remaining_turns() const { return !turn_queue_.empty(); }
    std::vector<UnitId> turn_order() const { return turn_queue_.turn_order(); }
    const TurnQueue& turn_queue() const { return turn_queue_; }

    // Active unit acts again later this round; false if it already waited
    bool wait_current_unit();

    // ==========================================================================
    // Actions
    // ==========================================================================

    // Runs Wait, Defend, WalkAndAttack or Shoot for the active unit
    ActionResult execute_action(const BattleAction& action);

    // Melee against an adjacent enemy, with at most one retaliation.
    // std::nullopt for null/dead/friendly/non-adjacent targets.
    std::optional<AttackResult> execute_attack(CombatUnit* attacker, CombatUnit* defender,
                                               i32 charge_distance = 0);

    // Ranged attack; consumes one shot and never provokes retaliation
    std::optional<AttackResult> execute_shoot(CombatUnit* attacker, CombatUnit* defender);

    // ==========================================================================
    // Battle end
    // ==========================================================================

    bool check_battle_end();
    void end_battle(std::optional<BattleSide> winner);

    bool is_finished() const { return finished_; }
    std::optional<BattleSide> winning_side() const { return winner_; }

    // ==========================================================================
    // Hex queries
    // ==========================================================================

    bool is_hex_occupied(BattleHex hex) const { return unit_at(hex) != nullptr; }
    bool is_hex_blocked(BattleHex hex) const;
    bool is_hex_accessible(BattleHex hex) const {
        return hex.is_available() && !is_hex_occupied(hex) && !is_hex_blocked(hex);
    }

    // ==========================================================================
    // State
    // ==========================================================================

    i32 current_round() const { return current_round_; }
    BattlePhase phase() const { return phase_; }

    const BattleSideInfo& side_info(BattleSide side) const { return sides_[side_index(side)]; }
    BattleSideInfo& side_info(BattleSide side) { return sides_[side_index(side)]; }

    DiceRoller& dice() { return dice_; }

    // "Battle Round 3 - Attacker: 4 units, Defender: 2 units"
    std::string battle_summary() const;

private:
    std::map<UnitId, CombatUnit> units_;
    UnitId next_unit_id_ = 0;

    std::unordered_map<BattleHex, BattleObstacle, BattleHexHash> obstacles_;
    std::array<BattleSideInfo, 2> sides_;
    BattleFieldType field_type_ = BattleFieldType::Grass;

    TurnQueue turn_queue_;
    DiceRoller dice_;

    BattlePhase phase_ = BattlePhase::NotStarted;
    i32 current_round_ = 0;
    UnitId active_unit_id_ = INVALID_UNIT;

    bool finished_ = false;
    std::optional<BattleSide> winner_;

    // Roll damage for one strike and apply it (no retaliation)
    AttackResult resolve_strike(CombatUnit& attacker, CombatUnit& defender,
                                const AttackContext& ctx);

    ActionResult execute_melee_action(CombatUnit& unit, const BattleAction& action);
    ActionResult execute_shoot_action(CombatUnit& unit, const BattleAction& action);
};

} // namespace eldor
