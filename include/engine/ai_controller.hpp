#pragma once

#include "core/types.hpp"
#include "core/combat_unit.hpp"
#include "engine/attack_possibility.hpp"
#include "engine/battle_action.hpp"
#include "engine/battle_state.hpp"
#include <optional>
#include <vector>

namespace eldor {

// ==============================================================================
// AI Controller - Greedy attack selection
// ==============================================================================
//
// Scores every shot (if the unit can shoot) and every melee strike against an
// adjacent enemy, and picks the strictly highest score. The first possibility
// found keeps ties. There is no movement planning: a unit with nothing in
// reach waits, or defends if it already waited this round.
//

class AIController {
public:
    explicit AIController(const BattleState& state) : state_(state) {}

    // std::nullopt for a null or dead unit, or when no enemy is left alive
    std::optional<BattleAction> select_action(const CombatUnit* unit) const;

    // Target of the selected action, nullptr for Wait/Defend
    const CombatUnit* best_target(const CombatUnit* unit) const;

    std::vector<AttackPossibility> evaluate_possibilities(const CombatUnit& unit) const;

private:
    const BattleState& state_;

    static BattleAction idle_action(const CombatUnit& unit) {
        return unit.has_waited() ? BattleAction::make_defend(unit) : BattleAction::make_wait(unit);
    }
};

} // namespace eldor
