#pragma once

#include "core/types.hpp"
#include "core/army.hpp"
#include "core/creature.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace eldor {

// ==============================================================================
// CreatureParser - Parses creature table text files into CreatureTypes
// ==============================================================================
//
// Input format (one creature per line, '#' starts a comment):
//   Name [id] A<atk> D<def> DMG<min>-<max> HP<hp> SPD<speed> [SHOTS<n>] [| Abilities]
//
// Example:
//   Marksman [4] A6 D3 DMG2-3 HP10 SPD6 SHOTS24 | Double Attack, Value(126)
//   Griffin A8 D8 DMG3-6 HP25 SPD6 | Flying, Double Wide
//
// Creatures without an [id] are numbered after the explicit ids are reserved.
// Damage is limited to MAX_CREATURE_DAMAGE and hit points to MAX_CREATURE_HP.
//
// Army rosters are written as "Name:count,Name:count" (at most 7 stacks of
// up to MAX_STACK_COUNT creatures).
//

class CreatureParser {
public:
    struct ParseResult {
        std::vector<CreatureType> creatures;
        std::vector<std::string> errors;
        size_t lines_processed = 0;
        size_t creatures_parsed = 0;
    };

    struct ArmyResult {
        Army army;
        std::vector<std::string> errors;

        bool ok() const { return errors.empty(); }
    };

    // Parse a file containing multiple creatures
    static ParseResult parse_file(const std::string& filepath);

    // Parse a string containing multiple creatures
    static ParseResult parse_string(const std::string& content);

    // Parse a single creature line. Unknown abilities are appended to
    // unknown_abilities (when given) and otherwise ignored.
    static std::optional<CreatureType> parse_creature(std::string_view line,
                                                      std::vector<std::string>* unknown_abilities = nullptr);

    // Adds every parsed creature to the table; returns how many were added.
    // Creatures whose id is already in the table are skipped with a warning.
    static size_t load_into(const ParseResult& result, CreatureTable& table);

    // "Pikeman:20,Archer:12" -> Army (names are case-insensitive)
    static ArmyResult parse_army(std::string_view roster, const CreatureTable& table,
                                 std::string_view army_name = "");

private:
    // Parse comma-separated abilities into the creature
    static void parse_abilities(std::string_view abilities_str, CreatureType& creature,
                                std::vector<std::string>* unknown_abilities);

    // Helper: trim whitespace
    static std::string_view trim(std::string_view sv);

    // Helper: split by delimiter (respecting parentheses)
    static std::vector<std::string_view> split_respecting_parens(std::string_view sv, char delim);

    static std::string lowercase(std::string_view sv);

    // Ability name to Ability mapping
    static const std::unordered_map<std::string, Ability>& get_ability_map();
};

// ==============================================================================
// Implementation
// ==============================================================================

inline std::string_view CreatureParser::trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
}

inline std::vector<std::string_view> CreatureParser::split_respecting_parens(std::string_view sv, char delim) {
    std::vector<std::string_view> result;
    size_t start = 0;
    int paren_depth = 0;

    for (size_t i = 0; i < sv.size(); ++i) {
        char c = sv[i];
        if (c == '(') paren_depth++;
        else if (c == ')') paren_depth = std::max(0, paren_depth - 1);
        else if (c == delim && paren_depth == 0) {
            auto part = trim(sv.substr(start, i - start));
            if (!part.empty()) result.push_back(part);
            start = i + 1;
        }
    }

    // Last part
    if (start < sv.size()) {
        auto part = trim(sv.substr(start));
        if (!part.empty()) result.push_back(part);
    }

    return result;
}

inline std::string CreatureParser::lowercase(std::string_view sv) {
    std::string out(sv);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline const std::unordered_map<std::string, Ability>& CreatureParser::get_ability_map() {
    static const std::unordered_map<std::string, Ability> map = {
        {"flying", Ability::Flying},
        {"flyer", Ability::Flying},
        {"double attack", Ability::DoubleAttack},
        {"double strike", Ability::DoubleAttack},
        {"shoot in melee", Ability::ShootInMelee},
        {"no melee penalty", Ability::ShootInMelee},
        {"no retaliation", Ability::NoMeleeRetaliation},
        {"no enemy retaliation", Ability::NoMeleeRetaliation},
        {"double wide", Ability::DoubleWide},
        {"two hex", Ability::DoubleWide},
    };
    return map;
}

inline void CreatureParser::parse_abilities(std::string_view abilities_str, CreatureType& creature,
                                            std::vector<std::string>* unknown_abilities) {
    static const std::regex value_re(R"(^value\s*\(\s*(\d{1,9})\s*\)$)");

    const auto& map = get_ability_map();
    for (auto ability_sv : split_respecting_parens(abilities_str, ',')) {
        std::string key = lowercase(ability_sv);

        std::smatch match;
        if (std::regex_match(key, match, value_re)) {
            creature.ai_value = std::stoi(match[1].str());
            continue;
        }

        auto it = map.find(key);
        if (it != map.end()) {
            creature.add_ability(it->second);
        } else if (unknown_abilities) {
            unknown_abilities->emplace_back(ability_sv);
        }
    }
}

inline std::optional<CreatureType> CreatureParser::parse_creature(std::string_view line,
                                                                  std::vector<std::string>* unknown_abilities) {
    // Example: "Archer [3] A6 D3 DMG2-3 HP10 SPD4 SHOTS12 | Value(126)"
    static const std::regex creature_re(
        R"(^(.+?)\s*(?:\[(\d{1,9})\])?\s+A(\d{1,4})\s+D(\d{1,4})\s+DMG(\d{1,6})-(\d{1,6})\s+HP(\d{1,6})\s+SPD(\d{1,3}))"
        R"((?:\s+SHOTS(\d{1,4}))?\s*(?:\|\s*(.*))?$)");

    std::string line_str(trim(line));
    std::smatch match;

    if (!std::regex_match(line_str, match, creature_re)) {
        return std::nullopt;
    }

    CreatureType creature(trim(match[1].str()),
                          std::stoi(match[3].str()),
                          std::stoi(match[4].str()),
                          std::stoi(match[5].str()),
                          std::stoi(match[6].str()),
                          std::stoi(match[7].str()),
                          std::stoi(match[8].str()));

    if (match[2].matched) {
        creature.creature_id = static_cast<u32>(std::stoul(match[2].str()));
    }
    if (match[9].matched) {
        creature.shots = std::stoi(match[9].str());
    }
    if (creature.hit_points <= 0 || creature.hit_points > MAX_CREATURE_HP ||
        creature.min_damage > MAX_CREATURE_DAMAGE || creature.max_damage > MAX_CREATURE_DAMAGE) {
        return std::nullopt;
    }

    if (match[10].matched) {
        parse_abilities(match[10].str(), creature, unknown_abilities);
    }

    return creature;
}

inline CreatureParser::ParseResult CreatureParser::parse_string(const std::string& content) {
    ParseResult result;
    std::vector<size_t> source_lines;

    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        result.lines_processed++;

        // Strip comments and carriage returns
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());

        if (trim(line).empty()) continue;

        std::vector<std::string> unknown;
        if (auto creature = parse_creature(line, &unknown)) {
            for (const auto& name : unknown) {
                result.errors.push_back("Unknown ability '" + name + "' at line " +
                                        std::to_string(result.lines_processed));
            }
            result.creatures.push_back(std::move(*creature));
            source_lines.push_back(result.lines_processed);
        } else {
            result.errors.push_back("Failed to parse creature at line " +
                                    std::to_string(result.lines_processed));
        }
    }

    // Reserve explicit ids first so a numbered line is never shadowed by an
    // earlier unnumbered one
    std::unordered_set<u32> taken;
    std::vector<CreatureType> accepted;
    std::vector<bool> auto_id;
    accepted.reserve(result.creatures.size());

    for (size_t i = 0; i < result.creatures.size(); ++i) {
        const u32 id = result.creatures[i].creature_id;
        if (id != 0 && !taken.insert(id).second) {
            result.errors.push_back("Duplicate creature id " + std::to_string(id) +
                                    " at line " + std::to_string(source_lines[i]));
            continue;
        }
        accepted.push_back(std::move(result.creatures[i]));
        auto_id.push_back(id == 0);
    }

    u32 next_id = 1;
    for (size_t i = 0; i < accepted.size(); ++i) {
        if (!auto_id[i]) continue;
        while (taken.count(next_id) != 0) next_id++;
        accepted[i].creature_id = next_id;
        taken.insert(next_id);
    }

    result.creatures = std::move(accepted);
    result.creatures_parsed = result.creatures.size();
    return result;
}

inline CreatureParser::ParseResult CreatureParser::parse_file(const std::string& filepath) {
    ParseResult result;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        result.errors.push_back("Could not open file: " + filepath);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_string(buffer.str());
}

inline size_t CreatureParser::load_into(const ParseResult& result, CreatureTable& table) {
    size_t added = 0;
    for (const auto& creature : result.creatures) {
        if (table.add(creature) == nullptr) {
            std::cerr << "Warning: creature id " << creature.creature_id << " ("
                      << creature.name.view() << ") is already in the table, skipped\n";
            continue;
        }
        added++;
    }
    return added;
}

inline CreatureParser::ArmyResult CreatureParser::parse_army(std::string_view roster,
                                                             const CreatureTable& table,
                                                             std::string_view army_name) {
    static const std::regex entry_re(R"(^(.+?)\s*:\s*(\d{1,9})$)");

    ArmyResult result;
    result.army.name = Name(army_name);

    for (auto entry : split_respecting_parens(roster, ',')) {
        std::string entry_str(entry);
        std::smatch match;

        if (!std::regex_match(entry_str, match, entry_re)) {
            result.errors.push_back("Bad army entry '" + entry_str + "' (expected Name:count)");
            continue;
        }

        const std::string name(trim(match[1].str()));
        const i32 count = std::stoi(match[2].str());

        const CreatureType* creature = table.find_by_name(name);
        if (creature == nullptr) {
            result.errors.push_back("Unknown creature '" + name + "'");
            continue;
        }
        if (count <= 0) {
            result.errors.push_back("Stack of '" + name + "' needs a positive count");
            continue;
        }
        if (count > MAX_STACK_COUNT) {
            result.errors.push_back("Stack of '" + name + "' exceeds " +
                                    std::to_string(MAX_STACK_COUNT) + " creatures");
            continue;
        }

        const i32 slot = result.army.first_free_slot();
        if (slot < 0) {
            result.errors.push_back("Army is full (" + std::to_string(ARMY_SLOTS) +
                                    " stacks), '" + name + "' ignored");
            continue;
        }
        result.army.set_slot(slot, creature->creature_id, count);
    }

    if (result.army.is_empty() && result.errors.empty()) {
        result.errors.push_back("Army roster is empty");
    }

    return result;
}

} // namespace eldor
