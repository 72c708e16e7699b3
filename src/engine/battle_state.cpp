#include "engine/battle_state.hpp"
#include <iostream>

namespace eldor {

std::string AttackResult::to_string() const {
    std::string result;
    result.reserve(96);
    result += attacker_name.view();
    result += is_shooting ? " Shot " : " Attacked ";
    result += defender_name.view();
    result += " for " + std::to_string(damage_dealt) + " damage (" +
              std::to_string(kills_dealt) + " killed)";
    if (is_killed) {
        result += " - destroyed";
    }

    if (retaliation) {
        result += "\n  -> Retaliation: " + std::to_string(retaliation->damage_dealt) +
                  " damage (" + std::to_string(retaliation->kills_dealt) + " killed)";
    }
    return result;
}

// ==============================================================================
// Construction & setup
// ==============================================================================

BattleState::BattleState(u64 seed) : dice_(seed) {
    sides_[0].side = BattleSide::Attacker;
    sides_[1].side = BattleSide::Defender;
}

BattleState::BattleState(const Army& attacker, const Army& defender, u64 seed)
    : BattleState(seed) {
    sides_[0].army = attacker;
    sides_[1].army = defender;
}

CombatUnit* BattleState::add_unit(const CreatureType* creature, i32 count, BattleSide side,
                                  i32 slot_index, BattleHex position) {
    if (creature == nullptr || count <= 0) return nullptr;

    const UnitId id = next_unit_id_++;
    auto [it, inserted] = units_.try_emplace(id, id, creature, count, side, slot_index, position);
    return inserted ? &it->second : nullptr;
}

i32 BattleState::deploy_armies(const CreatureTable& creatures) {
    i32 placed = 0;
    for (const BattleSideInfo& info : sides_) {
        for (i32 slot = 0; slot < ARMY_SLOTS; ++slot) {
            const CreatureStack& stack = info.army.slot(slot);
            if (stack.is_empty()) continue;

            const CreatureType* creature = creatures.find(stack.creature_id);
            if (creature == nullptr) {
                std::cerr << "Warning: " << to_string(info.side) << " slot " << slot
                          << " references unknown creature id " << stack.creature_id << "\n";
                continue;
            }

            if (add_unit(creature, stack.count, info.side, slot, starting_position(info.side, slot))) {
                placed++;
            }
        }
    }
    return placed;
}

BattleHex BattleState::starting_position(BattleSide side, i32 slot_index) {
    const i32 rank = slot_index / 3;
    const i32 row = 4 + slot_index % 3;
    const i32 col = (side == BattleSide::Attacker) ? 1 + rank : FIELD_WIDTH - 2 - rank;
    return BattleHex(col, row);
}

void BattleState::add_obstacle(BattleHex hex, BattleObstacle obstacle) {
    if (!hex.is_valid()) return;
    obstacles_[hex] = std::move(obstacle);
}

const BattleObstacle* BattleState::obstacle_at(BattleHex hex) const {
    auto it = obstacles_.find(hex);
    return it != obstacles_.end() ? &it->second : nullptr;
}

bool BattleState::is_hex_blocked(BattleHex hex) const {
    const BattleObstacle* obstacle = obstacle_at(hex);
    return obstacle != nullptr && obstacle->blocks_movement;
}

// ==============================================================================
// Unit queries
// ==============================================================================

CombatUnit* BattleState::unit(UnitId id) {
    auto it = units_.find(id);
    return it != units_.end() ? &it->second : nullptr;
}

const CombatUnit* BattleState::unit(UnitId id) const {
    auto it = units_.find(id);
    return it != units_.end() ? &it->second : nullptr;
}

std::vector<CombatUnit*> BattleState::all_units() {
    std::vector<CombatUnit*> result;
    result.reserve(units_.size());
    for (auto& [id, u] : units_) {
        result.push_back(&u);
    }
    return result;
}

std::vector<const CombatUnit*> BattleState::all_units() const {
    std::vector<const CombatUnit*> result;
    result.reserve(units_.size());
    for (const auto& [id, u] : units_) {
        result.push_back(&u);
    }
    return result;
}

std::vector<CombatUnit*> BattleState::units_for_side(BattleSide side) {
    std::vector<CombatUnit*> result;
    for (auto& [id, u] : units_) {
        if (u.side() == side && u.is_alive()) result.push_back(&u);
    }
    return result;
}

std::vector<const CombatUnit*> BattleState::units_for_side(BattleSide side) const {
    std::vector<const CombatUnit*> result;
    for (const auto& [id, u] : units_) {
        if (u.side() == side && u.is_alive()) result.push_back(&u);
    }
    return result;
}

i32 BattleState::living_count(BattleSide side) const {
    i32 count = 0;
    for (const auto& [id, u] : units_) {
        if (u.side() == side && u.is_alive()) count++;
    }
    return count;
}

CombatUnit* BattleState::unit_at(BattleHex hex) {
    for (auto& [id, u] : units_) {
        if (u.is_alive() && u.position() == hex) return &u;
    }
    return nullptr;
}

const CombatUnit* BattleState::unit_at(BattleHex hex) const {
    for (const auto& [id, u] : units_) {
        if (u.is_alive() && u.position() == hex) return &u;
    }
    return nullptr;
}

i32 BattleState::remove_dead_units() {
    i32 removed = 0;
    for (auto it = units_.begin(); it != units_.end();) {
        if (!it->second.is_alive()) {
            turn_queue_.remove_unit(it->first);
            if (active_unit_id_ == it->first) active_unit_id_ = INVALID_UNIT;
            it = units_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

// ==============================================================================
// Rounds & turns
// ==============================================================================

void BattleState::start_new_round() {
    if (phase_ == BattlePhase::NotStarted) {
        phase_ = BattlePhase::Normal;
    }
    current_round_++;
    active_unit_id_ = INVALID_UNIT;

    std::vector<const CombatUnit*> living;
    living.reserve(units_.size());
    for (auto& [id, u] : units_) {
        if (!u.is_alive()) continue;
        u.start_turn();
        u.update_status_effects();
        living.push_back(&u);
    }

    for (BattleSideInfo& info : sides_) {
        info.start_new_round();
    }

    turn_queue_.build_queue(living, current_round_);
}

CombatUnit* BattleState::get_next_unit() {
    // Stacks killed earlier in the round lose their turn
    for (UnitId id = turn_queue_.get_next_unit(); id != INVALID_UNIT; id = turn_queue_.get_next_unit()) {
        CombatUnit* next = unit(id);
        if (next != nullptr && next->is_alive()) {
            active_unit_id_ = id;
            return next;
        }
    }
    active_unit_id_ = INVALID_UNIT;
    return nullptr;
}

CombatUnit* BattleState::peek_next_unit() {
    return unit(turn_queue_.peek_next_unit());
}

CombatUnit* BattleState::active_unit() {
    return unit(active_unit_id_);
}

bool BattleState::wait_current_unit() {
    CombatUnit* current = active_unit();
    if (current == nullptr || !current->can_act() || current->has_waited()) return false;

    turn_queue_.move_to_wait_phase(current->id(), *current);
    active_unit_id_ = INVALID_UNIT;
    return true;
}

// ==============================================================================
// Actions
// ==============================================================================

ActionResult BattleState::execute_action(const BattleAction& action) {
    if (finished_ || !action.is_valid()) return {};

    CombatUnit* actor = unit(action.unit_id);
    if (actor == nullptr || action.unit_id != active_unit_id_ ||
        actor->side() != action.side || !actor->can_act()) {
        return {};
    }

    switch (action.type) {
        case ActionType::Wait:
            return ActionResult{wait_current_unit(), {}};

        case ActionType::Defend:
            actor->set_defending(true);
            actor->end_turn();
            return ActionResult{true, {}};

        case ActionType::WalkAndAttack:
            return execute_melee_action(*actor, action);

        case ActionType::Shoot:
            return execute_shoot_action(*actor, action);

        default:
            return {};
    }
}

ActionResult BattleState::execute_melee_action(CombatUnit& attacker, const BattleAction& action) {
    CombatUnit* target = unit(action.target_id);
    if (target == nullptr || !target->is_alive() || target->side() == attacker.side()) return {};

    const BattleHex start = attacker.position();
    i32 charge = 0;

    if (action.attack_from.is_valid() && action.attack_from != start) {
        const i32 dist = BattleHex::distance(start, action.attack_from);
        if (!is_hex_accessible(action.attack_from) || dist > attacker.movement_range() ||
            !action.attack_from.is_adjacent_to(target->position())) {
            return {};
        }
        attacker.set_position(action.attack_from);
        charge = dist;
    }

    std::optional<AttackResult> first = execute_attack(&attacker, target, charge);
    if (!first) {
        attacker.set_position(start);
        return {};
    }

    ActionResult result;
    result.executed = true;
    result.attacks.push_back(std::move(*first));

    if (attacker.has_double_attack() && attacker.is_alive() && target->is_alive()) {
        if (auto second = execute_attack(&attacker, target, 0)) {
            result.attacks.push_back(std::move(*second));
        }
    }

    if (action.return_after_attack && attacker.is_alive() && is_hex_accessible(start)) {
        attacker.set_position(start);
    }
    return result;
}

ActionResult BattleState::execute_shoot_action(CombatUnit& shooter, const BattleAction& action) {
    CombatUnit* target = unit(action.target_id);

    std::optional<AttackResult> first = execute_shoot(&shooter, target);
    if (!first) return {};

    ActionResult result;
    result.executed = true;
    result.attacks.push_back(std::move(*first));

    if (shooter.has_double_attack() && target->is_alive()) {
        if (auto second = execute_shoot(&shooter, target)) {
            result.attacks.push_back(std::move(*second));
        }
    }
    return result;
}

AttackResult BattleState::resolve_strike(CombatUnit& attacker, CombatUnit& defender,
                                         const AttackContext& ctx) {
    const DamageCalculator calculator(ctx);
    const DamageEstimation estimate = calculator.calculate_damage_range();

    const i32 damage = dice_.roll_range(estimate.damage.min, estimate.damage.max);
    // Casualties are read from the defender before the damage lands
    const i32 kills = calculator.casualties(damage);
    defender.take_damage(damage);

    AttackResult result;
    result.attacker_id = attacker.id();
    result.defender_id = defender.id();
    result.attacker_name = Name(attacker.name());
    result.defender_name = Name(defender.name());
    result.damage_dealt = damage;
    result.kills_dealt = kills;
    result.is_killed = !defender.is_alive();
    result.is_shooting = ctx.is_shooting;
    return result;
}

std::optional<AttackResult> BattleState::execute_attack(CombatUnit* attacker, CombatUnit* defender,
                                                        i32 charge_distance) {
    if (attacker == nullptr || defender == nullptr) return std::nullopt;
    if (!attacker->is_alive() || !defender->is_alive()) return std::nullopt;
    if (attacker->side() == defender->side()) return std::nullopt;
    if (!attacker->position().is_adjacent_to(defender->position())) return std::nullopt;

    const AttackContext ctx = AttackContext::melee(*attacker, *defender, charge_distance);
    AttackResult result = resolve_strike(*attacker, *defender, ctx);

    if (!result.is_killed && defender->can_retaliate() && !attacker->no_melee_retaliation()) {
        defender->use_retaliation();
        result.retaliation = std::make_unique<AttackResult>(
            resolve_strike(*defender, *attacker, ctx.reversed()));
    }

    attacker->end_turn();
    return result;
}

std::optional<AttackResult> BattleState::execute_shoot(CombatUnit* attacker, CombatUnit* defender) {
    if (attacker == nullptr || defender == nullptr) return std::nullopt;
    if (!attacker->is_alive() || !defender->is_alive()) return std::nullopt;
    if (attacker->side() == defender->side() || !attacker->can_shoot()) return std::nullopt;

    const AttackContext ctx = AttackContext::shooting(*attacker, *defender);
    AttackResult result = resolve_strike(*attacker, *defender, ctx);
    attacker->use_shot();
    attacker->end_turn();
    return result;
}

// ==============================================================================
// Battle end
// ==============================================================================

bool BattleState::check_battle_end() {
    if (finished_) return true;

    const bool attacker_alive = living_count(BattleSide::Attacker) > 0;
    const bool defender_alive = living_count(BattleSide::Defender) > 0;

    if (!attacker_alive && !defender_alive) {
        end_battle(std::nullopt);
        return true;
    }
    if (!attacker_alive) {
        end_battle(BattleSide::Defender);
        return true;
    }
    if (!defender_alive) {
        end_battle(BattleSide::Attacker);
        return true;
    }
    return false;
}

void BattleState::end_battle(std::optional<BattleSide> winner) {
    finished_ = true;
    winner_ = winner;
    phase_ = BattlePhase::Ended;
    active_unit_id_ = INVALID_UNIT;
}

std::string BattleState::battle_summary() const {
    return "Battle Round " + std::to_string(current_round_) +
           " - Attacker: " + std::to_string(living_count(BattleSide::Attacker)) +
           " units, Defender: " + std::to_string(living_count(BattleSide::Defender)) + " units";
}

} // namespace eldor
