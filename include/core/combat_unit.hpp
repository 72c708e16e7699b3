#pragma once

#include "core/types.hpp"
#include "core/creature.hpp"
#include "core/hex.hpp"
#include "core/status_effect.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace eldor {

// ==============================================================================
// CombatUnit - A stack of identical creatures fighting on one side
// ==============================================================================
//
// Health is tracked HOMM-style: `count` creatures are alive and only the lead
// creature may be partially damaged (`first_unit_hp`). Damage kills from the
// back of the stack and the remainder carries over to the next creature.
//
// Invariants: count >= 0, and 0 < first_unit_hp <= max_health while alive.
// A dead unit keeps its table entry with count == 0.
//

class CombatUnit {
public:
    // Throws std::invalid_argument when creature is null
    CombatUnit(UnitId id, const CreatureType* creature, i32 count,
               BattleSide side, i32 slot_index, BattleHex position);

    // Identity
    UnitId id() const { return id_; }
    const CreatureType& creature() const { return *creature_; }
    std::string_view name() const { return creature_->name.view(); }
    BattleSide side() const { return side_; }
    i32 slot_index() const { return slot_index_; }

    // Position
    BattleHex position() const { return position_; }
    void set_position(BattleHex hex) { position_ = hex; }

    // Health & stack count
    i32 count() const { return count_; }
    i32 first_unit_hp() const { return first_unit_hp_; }
    i32 max_health() const { return creature_->hit_points; }
    i32 total_health() const;
    bool is_alive() const { return count_ > 0; }

    // Base stats
    i32 base_attack() const { return creature_->attack; }
    i32 base_defense() const { return creature_->defense; }
    i32 base_speed() const { return creature_->speed; }
    i32 min_damage() const { return creature_->min_damage; }
    i32 max_damage() const { return creature_->max_damage; }

    // Effective stats (status effects + defending bonus, floored at 0)
    i32 attack() const { return effective_stat(StatType::Attack); }
    i32 defense() const { return effective_stat(StatType::Defense); }
    i32 speed() const { return effective_stat(StatType::Speed); }
    i32 initiative() const { return speed(); }
    i32 movement_range() const { return speed(); }

    // Abilities
    bool is_ranged() const { return creature_->is_ranged(); }
    bool can_shoot() const { return is_ranged() && shots_remaining_ > 0; }
    bool is_flying() const { return creature_->has_ability(Ability::Flying); }
    bool has_double_attack() const { return creature_->has_ability(Ability::DoubleAttack); }
    bool can_shoot_in_melee() const { return creature_->has_ability(Ability::ShootInMelee); }
    bool no_melee_retaliation() const { return creature_->has_ability(Ability::NoMeleeRetaliation); }
    bool is_double_wide() const { return creature_->has_ability(Ability::DoubleWide); }

    // Combat resources
    i32 shots_remaining() const { return shots_remaining_; }
    i32 retaliations_remaining() const { return retaliations_remaining_; }
    bool can_retaliate() const { return retaliations_remaining_ > 0 && !has_retaliated_this_turn_; }
    void use_shot();
    void use_retaliation();

    // Damage & healing
    void take_damage(i32 damage);
    void heal(i32 amount);
    void resurrect(i32 health_to_restore, i32 max_count);

    // Turn state
    void start_turn();
    void end_turn() { has_moved_ = true; }
    bool can_act() const { return is_alive() && !has_moved_; }

    bool has_moved() const { return has_moved_; }
    bool has_retaliated_this_turn() const { return has_retaliated_this_turn_; }
    bool is_defending() const { return is_defending_; }
    bool has_waited() const { return has_waited_; }
    bool had_morale_this_turn() const { return had_morale_this_turn_; }

    void set_defending(bool defending) { is_defending_ = defending; }
    void set_waited(bool waited) { has_waited_ = waited; }
    void set_had_morale(bool had_morale) { had_morale_this_turn_ = had_morale; }

    // Status effects
    void add_status_effect(const StatusEffect& effect);
    bool remove_status_effect(std::string_view effect_name);
    void clear_status_effects() { effects_.clear(); }
    void update_status_effects();
    const std::vector<StatusEffect>& status_effects() const { return effects_; }

    // "20 Pikeman (HP: 200/200) [Hex 52]"
    std::string to_string() const;

private:
    UnitId id_;
    const CreatureType* creature_;
    BattleSide side_;
    i32 slot_index_;
    BattleHex position_;

    i32 count_;
    i32 first_unit_hp_;

    i32 shots_remaining_;
    i32 retaliations_remaining_ = RETALIATIONS_PER_TURN;

    bool has_moved_ = false;
    bool has_retaliated_this_turn_ = false;
    bool is_defending_ = false;
    bool has_waited_ = false;
    bool had_morale_this_turn_ = false;

    std::vector<StatusEffect> effects_;

    i32 effective_stat(StatType stat) const;
};

} // namespace eldor
