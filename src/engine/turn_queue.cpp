#include "engine/turn_queue.hpp"
#include <algorithm>

namespace eldor {

TurnQueueEntry TurnQueue::make_entry(UnitId unit_id, const CombatUnit& unit, TurnPhase phase) {
    TurnQueueEntry entry;
    entry.unit_id = unit_id;
    entry.phase = phase;
    entry.initiative = unit.initiative();
    entry.side = unit.side();
    entry.slot_index = unit.slot_index();
    return entry;
}

void TurnQueue::build_queue(const std::vector<const CombatUnit*>& units, i32 round) {
    queue_.clear();
    current_round_ = round;
    current_phase_ = TurnPhase::Normal;

    for (const CombatUnit* unit : units) {
        if (unit == nullptr || !unit->is_alive() || unit->has_waited()) continue;
        queue_.push_back(make_entry(unit->id(), *unit, TurnPhase::Normal));
    }

    sort_queue();
}

UnitId TurnQueue::get_next_unit() {
    if (queue_.empty()) return INVALID_UNIT;

    const TurnQueueEntry entry = queue_.front();
    queue_.erase(queue_.begin());
    last_active_side_ = entry.side;

    // Cross-side ties depend on who acted last
    sort_queue();
    return entry.unit_id;
}

UnitId TurnQueue::peek_next_unit() const {
    return queue_.empty() ? INVALID_UNIT : queue_.front().unit_id;
}

void TurnQueue::move_to_wait_phase(UnitId unit_id, CombatUnit& unit) {
    remove_unit(unit_id);
    queue_.push_back(make_entry(unit_id, unit, TurnPhase::WaitedEligibleForMorale));
    unit.set_waited(true);
    sort_queue();
}

void TurnQueue::move_to_wait_phase_no_morale(UnitId unit_id) {
    auto it = std::find_if(queue_.begin(), queue_.end(),
        [unit_id](const TurnQueueEntry& e) { return e.unit_id == unit_id; });
    if (it == queue_.end()) return;

    it->phase = TurnPhase::WaitedNoMorale;
    sort_queue();
}

void TurnQueue::insert_bonus_turn(UnitId unit_id, const CombatUnit& unit) {
    queue_.insert(queue_.begin(), make_entry(unit_id, unit, current_phase_));
}

bool TurnQueue::remove_unit(UnitId unit_id) {
    const size_t before = queue_.size();
    queue_.erase(
        std::remove_if(queue_.begin(), queue_.end(),
            [unit_id](const TurnQueueEntry& e) { return e.unit_id == unit_id; }),
        queue_.end());
    return queue_.size() != before;
}

std::vector<UnitId> TurnQueue::turn_order() const {
    std::vector<UnitId> order;
    order.reserve(queue_.size());
    for (const auto& entry : queue_) {
        order.push_back(entry.unit_id);
    }
    return order;
}

// ==============================================================================
// Sorting
// ==============================================================================

void TurnQueue::sort_queue() {
    std::stable_sort(queue_.begin(), queue_.end(),
        [this](const TurnQueueEntry& a, const TurnQueueEntry& b) { return acts_before(a, b); });

    if (!queue_.empty()) {
        current_phase_ = queue_.front().phase;
    }
}

bool TurnQueue::acts_before(const TurnQueueEntry& a, const TurnQueueEntry& b) const {
    if (a.phase != b.phase) {
        return static_cast<u8>(a.phase) < static_cast<u8>(b.phase);
    }

    if (a.initiative != b.initiative) {
        return a.initiative > b.initiative;
    }

    if (a.side == b.side) {
        return a.slot_index < b.slot_index;
    }

    if (last_active_side_) {
        return b.side == *last_active_side_;
    }

    return a.side == BattleSide::Attacker;
}

} // namespace eldor
