#include "core/combat_unit.hpp"
#include <algorithm>
#include <stdexcept>

namespace eldor {

CombatUnit::CombatUnit(UnitId id, const CreatureType* creature, i32 count,
                       BattleSide side, i32 slot_index, BattleHex position)
    : id_(id), creature_(creature), side_(side), slot_index_(slot_index),
      position_(position), count_(std::max(0, count)), first_unit_hp_(0),
      shots_remaining_(0) {
    if (creature_ == nullptr) {
        throw std::invalid_argument("CombatUnit requires a creature type");
    }
    first_unit_hp_ = max_health();
    shots_remaining_ = creature_->shots;
}

i32 CombatUnit::total_health() const {
    if (count_ <= 0) return 0;
    return saturate_i32(static_cast<i64>(count_ - 1) * max_health() + first_unit_hp_);
}

// ==============================================================================
// Damage & Healing
// ==============================================================================

void CombatUnit::take_damage(i32 damage) {
    if (damage <= 0 || !is_alive()) return;
    if (max_health() <= 0) {
        count_ = 0;
        return;
    }

    i32 remaining = damage;

    // Lead creature absorbs first
    if (first_unit_hp_ > remaining) {
        first_unit_hp_ -= remaining;
        return;
    }
    remaining -= first_unit_hp_;
    count_--;
    first_unit_hp_ = max_health();

    // Whole creatures
    const i32 whole = std::min(remaining / max_health(), count_);
    remaining -= whole * max_health();
    count_ -= whole;

    // Leftover wounds the new lead creature
    if (count_ > 0 && remaining > 0) {
        first_unit_hp_ -= remaining;
        if (first_unit_hp_ <= 0) {
            count_--;
            first_unit_hp_ = max_health();
        }
    }

    count_ = std::max(0, count_);
}

void CombatUnit::heal(i32 amount) {
    if (amount <= 0 || !is_alive()) return;
    first_unit_hp_ = saturate_i32(std::min<i64>(static_cast<i64>(first_unit_hp_) + amount, max_health()));
}

void CombatUnit::resurrect(i32 health_to_restore, i32 max_count) {
    if (health_to_restore <= 0) return;

    i32 restored = health_to_restore / max_health();
    restored = std::clamp(restored, 0, std::max(0, max_count - count_));
    count_ += restored;

    const i32 remaining_health = health_to_restore % max_health();
    if (remaining_health > 0 && count_ > 0) {
        first_unit_hp_ = std::min(first_unit_hp_ + remaining_health, max_health());
    }
}

// ==============================================================================
// Resources & Turn State
// ==============================================================================

void CombatUnit::use_shot() {
    if (shots_remaining_ > 0) shots_remaining_--;
}

void CombatUnit::use_retaliation() {
    if (retaliations_remaining_ > 0) retaliations_remaining_--;
    has_retaliated_this_turn_ = true;
}

void CombatUnit::start_turn() {
    has_moved_ = false;
    has_retaliated_this_turn_ = false;
    is_defending_ = false;
    has_waited_ = false;
    had_morale_this_turn_ = false;
    retaliations_remaining_ = RETALIATIONS_PER_TURN;
}

// ==============================================================================
// Status Effects
// ==============================================================================

void CombatUnit::add_status_effect(const StatusEffect& effect) {
    effects_.push_back(effect);
}

bool CombatUnit::remove_status_effect(std::string_view effect_name) {
    auto it = std::find_if(effects_.begin(), effects_.end(),
        [effect_name](const StatusEffect& e) { return e.name.view() == effect_name; });
    if (it == effects_.end()) return false;
    effects_.erase(it);
    return true;
}

void CombatUnit::update_status_effects() {
    for (auto& effect : effects_) {
        effect.decrement_duration();
    }
    effects_.erase(
        std::remove_if(effects_.begin(), effects_.end(),
            [](const StatusEffect& e) { return e.is_expired(); }),
        effects_.end());
}

i32 CombatUnit::effective_stat(StatType stat) const {
    i32 base = 0;
    switch (stat) {
        case StatType::Attack: base = base_attack(); break;
        case StatType::Defense: base = base_defense(); break;
        case StatType::Speed: base = base_speed(); break;
    }

    i32 total = base;
    for (const auto& effect : effects_) {
        total += effect.modifier(stat);
    }

    if (stat == StatType::Defense && is_defending_) {
        total += base / 2;
    }

    return std::max(0, total);
}

std::string CombatUnit::to_string() const {
    return std::to_string(count_) + " " + std::string(name()) +
           " (HP: " + std::to_string(total_health()) + "/" +
           std::to_string(count_ * max_health()) + ") [Hex " +
           std::to_string(position_.value()) + "]";
}

} // namespace eldor
