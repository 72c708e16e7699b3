#include "core/army.hpp"
#include "core/creature.hpp"
#include "engine/battle_runner.hpp"
#include "engine/damage_calculator.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>

using namespace eldor;

int main() {
    std::cout << "=== Battle Benchmarks ===" << std::endl;
    std::cout << std::endl;

    CreatureTable table;
    const CreatureType* archer = table.add(CreatureType("Archer", 6, 3, 2, 3, 10, 4, 12));
    const CreatureType* orc = table.add(CreatureType("Orc", 8, 4, 2, 5, 15, 4, 12));
    const CreatureType* pikeman = table.add(CreatureType("Pikeman", 4, 5, 1, 3, 10, 4));
    const CreatureType* goblin = table.add(CreatureType("Goblin", 4, 2, 1, 2, 5, 5));

    // Damage range calculation
    {
        const u64 iterations = 10'000'000;
        CombatUnit attacker(0, archer, 20, BattleSide::Attacker, 0, BattleHex(1, 4));
        CombatUnit defender(1, orc, 15, BattleSide::Defender, 0, BattleHex(15, 4));

        auto start = std::chrono::high_resolution_clock::now();

        i64 sum = 0;
        for (u64 i = 0; i < iterations; ++i) {
            AttackContext ctx = AttackContext::shooting(attacker, defender);
            ctx.lucky_strike = (i & 7) == 0;
            sum += DamageCalculator(ctx).calculate_damage_range().damage.max;
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        double calcs_per_sec = iterations * 1000.0 / std::max<i64>(1, duration.count());

        std::cout << "Damage Calculations:" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(2)
                  << calcs_per_sec / 1e6 << " million/sec" << std::endl;
        std::cout << "  (Sum: " << sum << ")" << std::endl;
        std::cout << std::endl;
    }

    // Full AI-vs-AI battles at increasing stack sizes
    for (i32 scale : {1, 5, 20}) {
        Army attacker;
        attacker.set_slot(0, archer->creature_id, 10 * scale);
        attacker.set_slot(1, pikeman->creature_id, 20 * scale);
        Army defender;
        defender.set_slot(0, orc->creature_id, 8 * scale);
        defender.set_slot(1, goblin->creature_id, 30 * scale);

        const u64 battles = 20'000;
        u64 attacker_wins = 0;
        u64 rounds = 0;

        auto start = std::chrono::high_resolution_clock::now();

        BattleConfig config;
        for (u64 i = 0; i < battles; ++i) {
            config.seed = i + 1;
            BattleReport report = BattleRunner(table, config).run_battle(attacker, defender);
            if (report.winner == BattleSide::Attacker) attacker_wins++;
            rounds += report.rounds_played;
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        double battles_per_sec = battles * 1000.0 / std::max<i64>(1, duration.count());

        std::cout << "Stack scale x" << scale << ":" << std::endl;
        std::cout << "  Battles: " << battles << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(0)
                  << battles_per_sec << " battles/sec" << std::endl;
        std::cout << "  Attacker win rate: " << std::setprecision(1)
                  << (100.0 * attacker_wins / battles) << "%" << std::endl;
        std::cout << "  Avg rounds: " << std::setprecision(2)
                  << (1.0 * rounds / battles) << std::endl;
        std::cout << std::endl;
    }

    return 0;
}
