#include "engine/ai_controller.hpp"

namespace eldor {

std::vector<AttackPossibility> AIController::evaluate_possibilities(const CombatUnit& unit) const {
    std::vector<AttackPossibility> possibilities;

    for (const CombatUnit* enemy : state_.units_for_side(opposite(unit.side()))) {
        if (unit.can_shoot()) {
            possibilities.push_back(AttackPossibility::evaluate(unit, *enemy, unit.position(), true));
        }

        if (BattleHex::distance(unit.position(), enemy->position()) <= 1) {
            possibilities.push_back(AttackPossibility::evaluate(unit, *enemy, unit.position(), false));
        }
    }

    return possibilities;
}

std::optional<BattleAction> AIController::select_action(const CombatUnit* unit) const {
    if (unit == nullptr || !unit->is_alive()) return std::nullopt;
    if (state_.living_count(opposite(unit->side())) == 0) return std::nullopt;

    const std::vector<AttackPossibility> possibilities = evaluate_possibilities(*unit);
    if (possibilities.empty()) {
        return idle_action(*unit);
    }

    const AttackPossibility* best = &possibilities.front();
    for (const auto& p : possibilities) {
        if (p.score > best->score) best = &p;
    }

    if (best->is_shooting) {
        return BattleAction::make_shoot(*unit, *best->defender);
    }

    if (BattleHex::distance(unit->position(), best->defender->position()) <= 1) {
        return BattleAction::make_melee_attack(*unit, *best->defender);
    }

    return idle_action(*unit);
}

const CombatUnit* AIController::best_target(const CombatUnit* unit) const {
    const std::optional<BattleAction> action = select_action(unit);
    if (!action || action->target_id < 0) return nullptr;
    return state_.unit(action->target_id);
}

} // namespace eldor
