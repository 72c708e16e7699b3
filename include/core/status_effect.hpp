#pragma once

#include "core/types.hpp"

namespace eldor {

// ==============================================================================
// StatusEffect - Timed stat modifier (buff/debuff) on a combat unit
// ==============================================================================

struct StatusEffect {
    Name name;
    i32 duration         = 0;  // Rounds remaining
    i32 attack_modifier  = 0;
    i32 defense_modifier = 0;
    i32 speed_modifier   = 0;

    StatusEffect() = default;

    StatusEffect(std::string_view effect_name, i32 rounds,
                 i32 attack = 0, i32 defense = 0, i32 speed = 0)
        : name(effect_name), duration(rounds), attack_modifier(attack),
          defense_modifier(defense), speed_modifier(speed) {}

    bool is_expired() const { return duration <= 0; }

    void decrement_duration() {
        if (duration > 0) duration--;
    }

    i32 modifier(StatType stat) const {
        switch (stat) {
            case StatType::Attack: return attack_modifier;
            case StatType::Defense: return defense_modifier;
            case StatType::Speed: return speed_modifier;
        }
        return 0;
    }
};

} // namespace eldor
