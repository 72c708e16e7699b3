#pragma once

#include "core/types.hpp"
#include "core/army.hpp"
#include "core/creature.hpp"
#include "engine/battle_state.hpp"
#include "engine/ai_controller.hpp"
#include <array>
#include <optional>
#include <ostream>
#include <string>

namespace eldor {

// ==============================================================================
// Battle Configuration
// ==============================================================================

struct BattleConfig {
    u64 seed = 0;                 // 0 selects the default seed
    i32 max_rounds = 100;         // Battle is a draw after this many rounds
    bool detect_stalemate = true; // Stop after a round without any attack
    bool verbose = false;         // Narrate turns to the log stream
};

// ==============================================================================
// Battle Statistics
// ==============================================================================

struct SideStats {
    i64 damage_dealt = 0;
    i32 kills = 0;
    i32 melee_attacks = 0;
    i32 shots = 0;
    i32 retaliations = 0;
    i32 waits = 0;
    i32 defends = 0;

    i32 actions() const { return melee_attacks + shots + waits + defends; }
};

struct BattleStats {
    std::array<SideStats, 2> sides{};

    SideStats& side(BattleSide s) { return sides[side_index(s)]; }
    const SideStats& side(BattleSide s) const { return sides[side_index(s)]; }

    void record_attack(BattleSide attacker_side, const AttackResult& result) {
        SideStats& atk = side(attacker_side);
        atk.damage_dealt += result.damage_dealt;
        atk.kills += result.kills_dealt;
        if (result.is_shooting) atk.shots++;
        else atk.melee_attacks++;

        if (result.retaliation) {
            SideStats& def = side(opposite(attacker_side));
            def.damage_dealt += result.retaliation->damage_dealt;
            def.kills += result.retaliation->kills_dealt;
            def.retaliations++;
        }
    }

    void reset() { sides = {}; }
};

struct BattleReport {
    std::optional<BattleSide> winner;   // std::nullopt = draw
    bool finished = false;              // One or both sides were wiped out
    bool stalemate = false;
    i32 rounds_played = 0;
    BattleStats stats;

    bool is_draw() const { return !winner.has_value(); }
    const char* winner_name() const { return winner ? to_string(*winner) : "Draw"; }
};

// ==============================================================================
// Battle Runner - Drives an AI-vs-AI battle to completion
// ==============================================================================

class BattleRunner {
public:
    explicit BattleRunner(const CreatureTable& creatures, BattleConfig config = {},
                          std::ostream* log = nullptr)
        : creatures_(creatures), config_(config), log_(log) {}

    BattleReport run_battle(const Army& attacker, const Army& defender) {
        BattleState state(attacker, defender, config_.seed);
        state.deploy_armies(creatures_);
        return run(state);
    }

    // Runs a battle on a state the caller has already populated
    BattleReport run(BattleState& state) {
        BattleReport report;
        AIController ai(state);

        if (!state.check_battle_end()) {
            while (state.current_round() < config_.max_rounds) {
                state.start_new_round();
                narrate(state.battle_summary());

                const bool attacked = run_round(state, ai, report.stats);
                if (state.check_battle_end()) break;

                if (config_.detect_stalemate && !attacked) {
                    report.stalemate = true;
                    narrate("No attacks this round - stalemate");
                    break;
                }
            }
        }

        report.finished = state.is_finished();
        report.winner = state.winning_side();
        report.rounds_played = state.current_round();

        if (report.finished) {
            narrate(std::string("Battle over after round ") + std::to_string(report.rounds_played) +
                    ": " + report.winner_name());
        } else {
            narrate(std::string("Battle undecided after round ") + std::to_string(report.rounds_played));
        }
        return report;
    }

    // Executes `action` for the active unit, falling back to Defend when it is
    // rejected. If the fallback is rejected too the unit loses its turn and
    // nothing is recorded; the returned result then has executed == false.
    ActionResult play_turn(BattleState& state, CombatUnit& unit,
                           const BattleAction& action, BattleStats& stats) {
        ActionType performed = action.type;
        ActionResult result = state.execute_action(action);
        if (!result.executed) {
            narrate(std::string("Warning: rejected ") + action.to_string() + " for " + unit.to_string());
            performed = ActionType::Defend;
            result = state.execute_action(BattleAction::make_defend(unit));
        }
        if (!result.executed) {
            unit.end_turn();
            narrate(unit.to_string() + " loses its turn");
            return result;
        }

        record(performed, unit, result, stats);
        return result;
    }

    const BattleConfig& config() const { return config_; }
    void set_seed(u64 seed) { config_.seed = seed; }

private:
    const CreatureTable& creatures_;
    BattleConfig config_;
    std::ostream* log_;

    // Returns true if any attack was made this round
    bool run_round(BattleState& state, const AIController& ai, BattleStats& stats) {
        bool attacked = false;

        for (CombatUnit* unit = state.get_next_unit(); unit != nullptr; unit = state.get_next_unit()) {
            if (!unit->can_act()) continue;

            const std::optional<BattleAction> action = ai.select_action(unit);
            if (!action) break;  // No enemies left

            const ActionResult result = play_turn(state, *unit, *action, stats);
            if (!result.attacks.empty()) attacked = true;

            if (state.check_battle_end()) break;
        }
        return attacked;
    }

    void record(ActionType performed, const CombatUnit& unit,
                const ActionResult& result, BattleStats& stats) {
        SideStats& side = stats.side(unit.side());

        if (result.attacks.empty()) {
            if (performed == ActionType::Wait) {
                side.waits++;
                narrate(unit.to_string() + " waits");
            } else {
                side.defends++;
                narrate(unit.to_string() + " defends");
            }
            return;
        }

        for (const AttackResult& attack : result.attacks) {
            stats.record_attack(unit.side(), attack);
            narrate(attack.to_string());
        }
    }

    void narrate(const std::string& line) {
        if (config_.verbose && log_ != nullptr) {
            *log_ << line << "\n";
        }
    }
};

} // namespace eldor
