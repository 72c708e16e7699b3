#pragma once

#include "core/types.hpp"
#include <cctype>
#include <deque>
#include <string_view>

namespace eldor {

// ==============================================================================
// Creature Abilities (Compact representation)
// ==============================================================================

enum class Ability : u8 {
    Flying = 0,          // Ignores obstacles when moving
    DoubleAttack,        // Strikes twice in melee
    ShootInMelee,        // No penalty for ranged creatures fighting in melee
    NoMeleeRetaliation,  // Enemies cannot retaliate against its melee attacks
    DoubleWide,          // Occupies two hexes

    COUNT
};

using AbilityMask = u8;

inline constexpr AbilityMask ability_bit(Ability ability) {
    return static_cast<AbilityMask>(1u << static_cast<u8>(ability));
}

static_assert(static_cast<int>(Ability::COUNT) <= 8, "AbilityMask requires COUNT <= 8");

// ==============================================================================
// CreatureType - Immutable per-creature stats shared by every stack of it
// ==============================================================================

struct CreatureType {
    Name name;
    u32 creature_id = 0;

    i32 attack     = 0;
    i32 defense    = 0;
    i32 min_damage = 1;
    i32 max_damage = 1;
    i32 hit_points = 1;
    i32 speed      = 5;
    i32 shots      = 0;    // 0 = melee, >0 = ranged
    i32 ai_value   = 100;  // Strategic value used by AI

    AbilityMask abilities = 0;

    CreatureType() = default;

    CreatureType(std::string_view creature_name, i32 atk, i32 def,
                 i32 dmg_min, i32 dmg_max, i32 hp, i32 spd, i32 ammo = 0)
        : name(creature_name), attack(atk), defense(def),
          min_damage(dmg_min), max_damage(dmg_max), hit_points(hp),
          speed(spd), shots(ammo) {}

    void add_ability(Ability ability) { abilities |= ability_bit(ability); }
    bool has_ability(Ability ability) const { return (abilities & ability_bit(ability)) != 0; }

    bool is_ranged() const { return shots > 0; }
    f64 average_damage() const { return (min_damage + max_damage) / 2.0; }
    i32 total_health(i32 count) const { return saturate_i32(static_cast<i64>(hit_points) * count); }
};

// ==============================================================================
// CreatureTable - Read-only lookup passed into the battle engine
// ==============================================================================
//
// Pointers returned by add() stay valid for the lifetime of the table.
//

class CreatureTable {
public:
    // Assigns the next free id when the creature id is 0.
    // Returns nullptr (and adds nothing) when the id is already taken.
    const CreatureType* add(CreatureType creature) {
        if (creature.creature_id == 0) {
            while (next_id_ == 0 || find(next_id_) != nullptr) next_id_++;
            creature.creature_id = next_id_;
        } else if (find(creature.creature_id) != nullptr) {
            return nullptr;
        }
        next_id_ = std::max(next_id_, creature.creature_id + 1);
        creatures_.push_back(creature);
        return &creatures_.back();
    }

    const CreatureType* find(u32 creature_id) const {
        for (const auto& creature : creatures_) {
            if (creature.creature_id == creature_id) return &creature;
        }
        return nullptr;
    }

    // Case-insensitive name lookup
    const CreatureType* find_by_name(std::string_view name) const {
        for (const auto& creature : creatures_) {
            std::string_view candidate = creature.name.view();
            if (candidate.size() != name.size()) continue;
            bool match = true;
            for (size_t i = 0; i < name.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(candidate[i])) !=
                    std::tolower(static_cast<unsigned char>(name[i]))) {
                    match = false;
                    break;
                }
            }
            if (match) return &creature;
        }
        return nullptr;
    }

    size_t size() const { return creatures_.size(); }
    bool empty() const { return creatures_.empty(); }

    auto begin() const { return creatures_.begin(); }
    auto end() const { return creatures_.end(); }

private:
    std::deque<CreatureType> creatures_;
    u32 next_id_ = 1;
};

} // namespace eldor
