/**
 * Eldor Battle Simulator - Tactical hex combat core
 *
 * Runs seeded AI-vs-AI battles between two armies on the 17x11 hex
 * battlefield and reports win rates and per-side combat statistics.
 *
 * Creatures come from a creature table file (-f) or the built-in demo
 * table (-d). Armies are given as "Name:count,Name:count" rosters.
 */

#include "core/types.hpp"
#include "core/army.hpp"
#include "core/creature.hpp"
#include "engine/battle_runner.hpp"
#include "parser/creature_parser.hpp"

#include <iostream>
#include <iomanip>
#include <chrono>
#include <exception>
#include <string>
#include <vector>

using namespace eldor;

// ==============================================================================
// CLI Configuration
// ==============================================================================

struct SimConfig {
    std::string creatures_file;
    std::string attacker_roster;
    std::string defender_roster;
    u64 num_battles = 1000;
    u64 seed = 1;
    i32 max_rounds = 100;
    bool verbose = false;
    bool show_help = false;
    bool demo_mode = false;
};

// ==============================================================================
// Demo Creature Definitions (parsed from text format)
// ==============================================================================

const char* DEMO_CREATURES = R"(
# Castle
Pikeman [1] A4 D5 DMG1-3 HP10 SPD4 | Value(80)
Archer [2] A6 D3 DMG2-3 HP10 SPD4 SHOTS12 | Value(126)
Griffin [3] A8 D8 DMG3-6 HP25 SPD6 | Flying, Double Wide, Value(351)
Crusader [4] A12 D12 DMG7-10 HP35 SPD6 | Double Attack, Value(1446)

# Stronghold
Goblin [10] A4 D2 DMG1-2 HP5 SPD5 | Value(60)
Orc [11] A8 D4 DMG2-5 HP15 SPD4 SHOTS12 | Value(192)
Wolf Rider [12] A7 D5 DMG2-4 HP10 SPD6 | Double Wide, Value(209)
Ogre Mage [13] A13 D7 DMG6-12 HP60 SPD5 | Value(672)
)";

const char* DEMO_ATTACKER = "Pikeman:30,Archer:15,Griffin:8,Crusader:4";
const char* DEMO_DEFENDER = "Goblin:50,Orc:14,Wolf Rider:12,Ogre Mage:3";

// ==============================================================================
// Main Entry Point
// ==============================================================================

void print_banner() {
    std::cout << R"(
  _____ _     _              ____        _   _   _
 | ____| | __| | ___  _ __  | __ )  __ _| |_| |_| | ___
 |  _| | |/ _` |/ _ \| '__| |  _ \ / _` | __| __| |/ _ \
 | |___| | (_| | (_) | |    | |_) | (_| | |_| |_| |  __/
 |_____|_|\__,_|\___/|_|    |____/ \__,_|\__|\__|_|\___|

 Eldor Tactical Battle Simulator v1.0
 Hex Battlefield, Initiative Queue & Greedy AI
)" << std::endl;
}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -f <file>      Creature table to load\n";
    std::cout << "  -a <army>      Attacker roster, e.g. \"Pikeman:20,Archer:10\"\n";
    std::cout << "  -b <army>      Defender roster\n";
    std::cout << "  -n <count>     Number of battles to simulate (default: 1000)\n";
    std::cout << "  -s <seed>      Seed of the first battle (default: 1)\n";
    std::cout << "  -r <rounds>    Round limit per battle (default: 100)\n";
    std::cout << "  -v             Narrate the first battle\n";
    std::cout << "  -d             Run demo with built-in creatures\n";
    std::cout << "  -h             Show this help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog << " -d -v\n";
    std::cout << "  " << prog << " -f creatures.txt -a \"Pikeman:20\" -b \"Goblin:40\" -n 5000\n";
    std::cout << "\nBattle Rules:\n";
    std::cout << "  - Attacker deploys on the left, defender on the right\n";
    std::cout << "  - Units act by speed, ties alternate between sides\n";
    std::cout << "  - Battle ends when a side is wiped out, at the round limit,\n";
    std::cout << "    or after a full round without any attack\n";
}

SimConfig parse_args(int argc, char* argv[]) {
    SimConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "-d" || arg == "--demo") {
            config.demo_mode = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-f" && i + 1 < argc) {
            config.creatures_file = argv[++i];
        } else if (arg == "-a" && i + 1 < argc) {
            config.attacker_roster = argv[++i];
        } else if (arg == "-b" && i + 1 < argc) {
            config.defender_roster = argv[++i];
        } else if (arg == "-n" && i + 1 < argc) {
            config.num_battles = std::stoull(argv[++i]);
        } else if (arg == "-s" && i + 1 < argc) {
            config.seed = std::stoull(argv[++i]);
        } else if (arg == "-r" && i + 1 < argc) {
            config.max_rounds = std::stoi(argv[++i]);
        } else {
            std::cerr << "Warning: ignoring argument '" << arg << "'" << std::endl;
        }
    }

    // Default to demo mode if no file specified and no help requested
    if (config.creatures_file.empty() && !config.show_help) {
        config.demo_mode = true;
    }

    return config;
}

// ==============================================================================
// Simulation Functions
// ==============================================================================

void print_army(const char* label, const Army& army, const CreatureTable& creatures) {
    std::cout << "  " << label << ":";
    for (const auto& stack : army.slots) {
        if (stack.is_empty()) continue;
        const CreatureType* creature = creatures.find(stack.creature_id);
        std::cout << " " << stack.count << "x " << (creature ? creature->name.c_str() : "?");
    }
    std::cout << std::endl;
}

void print_side_stats(const char* label, const SideStats& totals, u64 battles) {
    std::cout << "  " << label << ":" << std::endl;
    std::cout << "    Damage Dealt: " << (1.0 * totals.damage_dealt / battles) << std::endl;
    std::cout << "    Creatures Killed: " << (1.0 * totals.kills / battles) << std::endl;
    std::cout << "    Melee Attacks: " << (1.0 * totals.melee_attacks / battles)
              << ", Shots: " << (1.0 * totals.shots / battles)
              << ", Retaliations: " << (1.0 * totals.retaliations / battles) << std::endl;
}

void run_matchup(const CreatureTable& creatures, const Army& attacker, const Army& defender,
                 const SimConfig& config) {
    std::cout << "Matchup:" << std::endl;
    print_army("Attacker", attacker, creatures);
    print_army("Defender", defender, creatures);
    std::cout << std::endl;

    u64 attacker_wins = 0;
    u64 defender_wins = 0;
    u64 draws = 0;
    u64 stalemates = 0;
    u64 total_rounds = 0;
    BattleStats totals;

    BattleConfig battle_config;
    battle_config.max_rounds = config.max_rounds;

    auto start = std::chrono::high_resolution_clock::now();

    for (u64 i = 0; i < config.num_battles; ++i) {
        battle_config.seed = config.seed + i;
        battle_config.verbose = config.verbose && i == 0;

        BattleRunner runner(creatures, battle_config, &std::cout);
        BattleReport report = runner.run_battle(attacker, defender);

        if (!report.winner) draws++;
        else if (*report.winner == BattleSide::Attacker) attacker_wins++;
        else defender_wins++;

        if (report.stalemate) stalemates++;
        total_rounds += report.rounds_played;

        for (BattleSide side : {BattleSide::Attacker, BattleSide::Defender}) {
            const SideStats& s = report.stats.side(side);
            SideStats& t = totals.side(side);
            t.damage_dealt += s.damage_dealt;
            t.kills += s.kills;
            t.melee_attacks += s.melee_attacks;
            t.shots += s.shots;
            t.retaliations += s.retaliations;
        }

        if (battle_config.verbose) std::cout << std::endl;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);

    const u64 n = config.num_battles;
    std::cout << "Results (" << n << " battles):" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Attacker Win Rate: " << (100.0 * attacker_wins / n) << "%" << std::endl;
    std::cout << "  Defender Win Rate: " << (100.0 * defender_wins / n) << "%" << std::endl;
    std::cout << "  Draw Rate: " << (100.0 * draws / n) << "% (" << stalemates << " stalemates)" << std::endl;
    std::cout << std::endl;
    std::cout << "  Avg Rounds Played: " << (1.0 * total_rounds / n) << std::endl;
    std::cout << std::endl;
    std::cout << "Combat Stats (per battle average):" << std::endl;
    print_side_stats("Attacker", totals.side(BattleSide::Attacker), n);
    print_side_stats("Defender", totals.side(BattleSide::Defender), n);

    if (duration.count() > 0) {
        f64 battles_per_sec = n * 1'000'000.0 / duration.count();
        std::cout << "\nPerformance: " << std::fixed << std::setprecision(0)
                  << battles_per_sec << " battles/second" << std::endl;
    }
}

bool build_army(const std::string& roster, const CreatureTable& creatures,
                const char* label, Army& out) {
    auto result = CreatureParser::parse_army(roster, creatures, label);
    for (const auto& err : result.errors) {
        std::cerr << "Error: " << label << " army: " << err << std::endl;
    }
    if (!result.ok()) return false;
    out = result.army;
    return true;
}

int run(const SimConfig& config) {
    CreatureTable creatures;

    CreatureParser::ParseResult parse_result = config.demo_mode
        ? CreatureParser::parse_string(DEMO_CREATURES)
        : CreatureParser::parse_file(config.creatures_file);

    if (!config.demo_mode) {
        std::cout << "Loading creatures from: " << config.creatures_file << std::endl;
    }

    for (const auto& err : parse_result.errors) {
        std::cerr << "Warning: " << err << std::endl;
    }

    if (CreatureParser::load_into(parse_result, creatures) == 0) {
        std::cerr << "Error: No creatures loaded" << std::endl;
        return 1;
    }
    std::cout << "Loaded " << creatures.size() << " creatures" << std::endl;

    if (config.verbose) {
        for (const auto& creature : creatures) {
            std::cout << "  [" << creature.creature_id << "] " << creature.name.c_str()
                      << " A" << creature.attack << " D" << creature.defense
                      << " DMG" << creature.min_damage << "-" << creature.max_damage
                      << " HP" << creature.hit_points << " SPD" << creature.speed;
            if (creature.is_ranged()) std::cout << " SHOTS" << creature.shots;
            std::cout << std::endl;
        }
    }
    std::cout << std::endl;

    std::string attacker_roster = config.attacker_roster;
    std::string defender_roster = config.defender_roster;
    if (config.demo_mode) {
        if (attacker_roster.empty()) attacker_roster = DEMO_ATTACKER;
        if (defender_roster.empty()) defender_roster = DEMO_DEFENDER;
    }

    if (attacker_roster.empty() || defender_roster.empty()) {
        std::cerr << "Error: both -a and -b rosters are required" << std::endl;
        return 1;
    }

    Army attacker;
    Army defender;
    if (!build_army(attacker_roster, creatures, "Attacker", attacker) ||
        !build_army(defender_roster, creatures, "Defender", defender)) {
        return 1;
    }

    if (config.num_battles == 0) {
        std::cerr << "Error: battle count must be positive" << std::endl;
        return 1;
    }

    run_matchup(creatures, attacker, defender, config);
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        SimConfig config = parse_args(argc, argv);

        print_banner();

        if (config.show_help) {
            print_usage(argv[0]);
            return 0;
        }

        return run(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
