#pragma once

#include "core/types.hpp"
#include <array>

namespace eldor {

// ==============================================================================
// Army - Seven creature slots brought into battle by one side
// ==============================================================================

struct CreatureStack {
    u32 creature_id = 0;
    i32 count       = 0;

    bool is_empty() const { return count <= 0; }
};

struct Army {
    Name name;
    std::array<CreatureStack, ARMY_SLOTS> slots{};

    Army() = default;
    explicit Army(std::string_view army_name) : name(army_name) {}

    bool set_slot(i32 slot_index, u32 creature_id, i32 count) {
        if (slot_index < 0 || slot_index >= ARMY_SLOTS) return false;
        slots[slot_index] = CreatureStack{creature_id, count};
        return true;
    }

    const CreatureStack& slot(i32 slot_index) const { return slots[slot_index]; }

    // First empty slot, or -1 if all seven are taken
    i32 first_free_slot() const {
        for (i32 i = 0; i < ARMY_SLOTS; ++i) {
            if (slots[i].is_empty()) return i;
        }
        return -1;
    }

    i32 stack_count() const {
        i32 n = 0;
        for (const auto& stack : slots) {
            if (!stack.is_empty()) n++;
        }
        return n;
    }

    i32 total_creatures() const {
        i32 total = 0;
        for (const auto& stack : slots) {
            if (!stack.is_empty()) total += stack.count;
        }
        return total;
    }

    bool is_empty() const { return stack_count() == 0; }
};

} // namespace eldor
