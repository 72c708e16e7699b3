#pragma once

#include "core/types.hpp"
#include "core/hex.hpp"
#include "core/combat_unit.hpp"
#include <string>
#include <vector>

namespace eldor {

// ==============================================================================
// Action Types
// ==============================================================================
//
// Only Wait, Defend, WalkAndAttack and Shoot are executed by BattleState.
// The rest are declared so front ends can describe them.
//

enum class ActionType : u8 {
    NoAction = 0,
    EndTacticPhase,
    Retreat,
    Surrender,
    HeroSpell,
    MonsterSpell,
    Walk,
    Wait,
    Defend,
    WalkAndAttack,
    Shoot,
    BadMorale,
    StackHeal,
    Catapult
};

inline constexpr const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::NoAction: return "NoAction";
        case ActionType::EndTacticPhase: return "EndTacticPhase";
        case ActionType::Retreat: return "Retreat";
        case ActionType::Surrender: return "Surrender";
        case ActionType::HeroSpell: return "HeroSpell";
        case ActionType::MonsterSpell: return "MonsterSpell";
        case ActionType::Walk: return "Walk";
        case ActionType::Wait: return "Wait";
        case ActionType::Defend: return "Defend";
        case ActionType::WalkAndAttack: return "WalkAndAttack";
        case ActionType::Shoot: return "Shoot";
        case ActionType::BadMorale: return "BadMorale";
        case ActionType::StackHeal: return "StackHeal";
        case ActionType::Catapult: return "Catapult";
    }
    return "Unknown";
}

// ==============================================================================
// Battle Action - A command addressed to the engine
// ==============================================================================

struct BattleAction {
    BattleSide side = BattleSide::Attacker;
    UnitId unit_id = INVALID_UNIT;   // INVALID_UNIT for hero actions
    ActionType type = ActionType::NoAction;

    BattleHex destination;           // Move target / attacked hex
    UnitId target_id = INVALID_UNIT;
    std::vector<UnitId> additional_targets;

    i32 spell_id = -1;

    BattleHex attack_from;           // Invalid: attack from the current hex
    bool return_after_attack = false;  // Step back to the start hex after striking

    // Factories

    static BattleAction make_defend(const CombatUnit& unit) {
        return make_unit_action(unit, ActionType::Defend);
    }

    static BattleAction make_wait(const CombatUnit& unit) {
        return make_unit_action(unit, ActionType::Wait);
    }

    static BattleAction make_walk(const CombatUnit& unit, BattleHex dest) {
        BattleAction action = make_unit_action(unit, ActionType::Walk);
        action.destination = dest;
        return action;
    }

    static BattleAction make_melee_attack(const CombatUnit& attacker, const CombatUnit& target,
                                          BattleHex from = BattleHex::invalid(),
                                          bool return_after = false) {
        BattleAction action = make_unit_action(attacker, ActionType::WalkAndAttack);
        action.target_id = target.id();
        action.destination = target.position();
        action.attack_from = from;
        action.return_after_attack = return_after;
        return action;
    }

    static BattleAction make_shoot(const CombatUnit& shooter, const CombatUnit& target) {
        BattleAction action = make_unit_action(shooter, ActionType::Shoot);
        action.target_id = target.id();
        action.destination = target.position();
        return action;
    }

    static BattleAction make_spell_cast(BattleSide side, i32 spell, BattleHex target_hex,
                                        UnitId target = INVALID_UNIT) {
        BattleAction action;
        action.side = side;
        action.type = ActionType::HeroSpell;
        action.spell_id = spell;
        action.destination = target_hex;
        action.target_id = target;
        return action;
    }

    static BattleAction make_retreat(BattleSide side) {
        BattleAction action;
        action.side = side;
        action.type = ActionType::Retreat;
        return action;
    }

    static BattleAction make_bad_morale(const CombatUnit& unit) {
        return make_unit_action(unit, ActionType::BadMorale);
    }

    bool is_valid() const {
        if (type == ActionType::NoAction) return false;

        if ((type == ActionType::Walk || type == ActionType::WalkAndAttack) && !destination.is_valid()) {
            return false;
        }
        if ((type == ActionType::WalkAndAttack || type == ActionType::Shoot) && target_id < 0) {
            return false;
        }
        if ((type == ActionType::HeroSpell || type == ActionType::MonsterSpell) && spell_id < 0) {
            return false;
        }
        return true;
    }

    std::string to_string() const {
        switch (type) {
            case ActionType::Walk:
                return "Walk to " + destination.to_string();
            case ActionType::WalkAndAttack:
                if (attack_from.is_valid()) {
                    return "Attack unit " + std::to_string(target_id) + " from " + attack_from.to_string();
                }
                return "Attack unit " + std::to_string(target_id);
            case ActionType::Shoot:
                return "Shoot at unit " + std::to_string(target_id);
            case ActionType::Wait:
                return "Wait";
            case ActionType::Defend:
                return "Defend";
            case ActionType::HeroSpell:
                return "Cast spell " + std::to_string(spell_id) + " at " + destination.to_string();
            case ActionType::Retreat:
                return "Retreat";
            case ActionType::Surrender:
                return "Surrender";
            case ActionType::BadMorale:
                return "Bad morale (skip turn)";
            default:
                return eldor::to_string(type);
        }
    }

private:
    static BattleAction make_unit_action(const CombatUnit& unit, ActionType type) {
        BattleAction action;
        action.side = unit.side();
        action.unit_id = unit.id();
        action.type = type;
        return action;
    }
};

} // namespace eldor
