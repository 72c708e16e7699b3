#pragma once

#include "core/types.hpp"
#include <array>
#include <functional>
#include <limits>
#include <string>

namespace eldor {

// ==============================================================================
// BattleHex - A cell on the 17x11 hex battlefield
// ==============================================================================
//
// Cells are addressed by a single index: index = x + y * FIELD_WIDTH.
// Rows use offset coordinates (odd rows are shifted), so neighbor lookup
// depends on the row parity. Columns 0 and 16 hold the hero icons and are
// never available to units.
//

class BattleHex {
public:
    static constexpr i32 INVALID       = -1;
    static constexpr i32 HERO_ATTACKER = 0;
    static constexpr i32 HERO_DEFENDER = FIELD_WIDTH - 1;
    static constexpr i32 INFINITE_DISTANCE = std::numeric_limits<i32>::max();

    enum class Direction : i8 {
        None        = -1,
        TopLeft     = 0,
        TopRight    = 1,
        Right       = 2,
        BottomRight = 3,
        BottomLeft  = 4,
        Left        = 5
    };

    static constexpr std::array<Direction, 6> ALL_DIRECTIONS = {
        Direction::TopLeft, Direction::TopRight, Direction::Right,
        Direction::BottomRight, Direction::BottomLeft, Direction::Left
    };

    constexpr BattleHex() : hex_(INVALID) {}
    constexpr explicit BattleHex(i32 index) : hex_(index) {}

    // Out-of-range coordinates are clamped onto the grid (with a warning)
    BattleHex(i32 x, i32 y);

    static constexpr BattleHex invalid() { return BattleHex(INVALID); }

    constexpr i32 x() const { return hex_ % FIELD_WIDTH; }
    constexpr i32 y() const { return hex_ / FIELD_WIDTH; }
    constexpr i32 value() const { return hex_; }

    constexpr bool is_valid() const { return hex_ >= 0 && hex_ < FIELD_SIZE; }
    constexpr bool is_available() const {
        return is_valid() && x() > 0 && x() < FIELD_WIDTH - 1;
    }

    void set_xy(i32 x, i32 y);

    BattleHex neighbor(Direction dir) const;
    std::array<BattleHex, 6> all_neighbors() const;

    // Hex distance; INFINITE_DISTANCE if either hex is invalid
    static i32 distance(BattleHex a, BattleHex b);

    bool is_adjacent_to(BattleHex other) const { return distance(*this, other) == 1; }

    std::string to_string() const;

    constexpr bool operator==(const BattleHex& other) const { return hex_ == other.hex_; }
    constexpr bool operator!=(const BattleHex& other) const { return hex_ != other.hex_; }
    constexpr bool operator<(const BattleHex& other) const { return hex_ < other.hex_; }

private:
    i32 hex_;
};

struct BattleHexHash {
    size_t operator()(const BattleHex& hex) const {
        return std::hash<i32>{}(hex.value());
    }
};

} // namespace eldor
