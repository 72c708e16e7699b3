#pragma once

#include "core/types.hpp"
#include "core/combat_unit.hpp"
#include <optional>
#include <vector>

namespace eldor {

// ==============================================================================
// Turn Queue - Initiative order for the current round
// ==============================================================================
//
// Order: phase ascending, then initiative descending. Ties on the same side
// go by army slot; ties across sides favour the side that did not act last,
// and the attacker when no unit has acted yet.
//

struct TurnQueueEntry {
    UnitId unit_id   = INVALID_UNIT;
    TurnPhase phase  = TurnPhase::Normal;
    i32 initiative   = 0;  // Cached at insertion time
    BattleSide side  = BattleSide::Attacker;
    i32 slot_index   = 0;
};

class TurnQueue {
public:
    // Clears the queue and adds every living unit that has not waited
    void build_queue(const std::vector<const CombatUnit*>& units, i32 round);

    // INVALID_UNIT (-1) when the round is over
    UnitId get_next_unit();
    UnitId peek_next_unit() const;

    // Unit acts after the remaining Normal-phase units of this round
    void move_to_wait_phase(UnitId unit_id, CombatUnit& unit);
    void move_to_wait_phase_no_morale(UnitId unit_id);

    // Good morale: the unit acts immediately, ahead of the sorted order
    void insert_bonus_turn(UnitId unit_id, const CombatUnit& unit);

    bool remove_unit(UnitId unit_id);

    bool empty() const { return queue_.empty(); }
    size_t remaining() const { return queue_.size(); }
    std::vector<UnitId> turn_order() const;
    const std::vector<TurnQueueEntry>& entries() const { return queue_; }

    TurnPhase current_phase() const { return current_phase_; }
    i32 current_round() const { return current_round_; }
    std::optional<BattleSide> last_active_side() const { return last_active_side_; }

private:
    std::vector<TurnQueueEntry> queue_;
    i32 current_round_ = 0;
    TurnPhase current_phase_ = TurnPhase::Normal;
    std::optional<BattleSide> last_active_side_;

    static TurnQueueEntry make_entry(UnitId unit_id, const CombatUnit& unit, TurnPhase phase);

    void sort_queue();
    bool acts_before(const TurnQueueEntry& a, const TurnQueueEntry& b) const;
};

} // namespace eldor
