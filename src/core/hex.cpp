#include "core/hex.hpp"
#include <cstdlib>
#include <iostream>

namespace eldor {

namespace {

i32 clamped_index(i32 x, i32 y) {
    if (x < 0 || x >= FIELD_WIDTH || y < 0 || y >= FIELD_HEIGHT) {
        std::cerr << "Warning: Invalid hex coords (" << x << ", " << y
                  << "), clamping to valid range\n";
        x = std::clamp(x, 0, FIELD_WIDTH - 1);
        y = std::clamp(y, 0, FIELD_HEIGHT - 1);
    }
    return x + y * FIELD_WIDTH;
}

} // namespace

BattleHex::BattleHex(i32 x, i32 y) : hex_(clamped_index(x, y)) {}

void BattleHex::set_xy(i32 x, i32 y) {
    hex_ = clamped_index(x, y);
}

BattleHex BattleHex::neighbor(Direction dir) const {
    if (dir == Direction::None) return *this;
    if (!is_valid()) return invalid();

    i32 nx = x();
    i32 ny = y();
    const bool odd_row = (ny % 2) == 1;

    switch (dir) {
        case Direction::TopLeft:
            nx = odd_row ? nx - 1 : nx;
            ny = ny - 1;
            break;
        case Direction::TopRight:
            nx = odd_row ? nx : nx + 1;
            ny = ny - 1;
            break;
        case Direction::Right:
            nx = nx + 1;
            break;
        case Direction::BottomRight:
            nx = odd_row ? nx : nx + 1;
            ny = ny + 1;
            break;
        case Direction::BottomLeft:
            nx = odd_row ? nx - 1 : nx;
            ny = ny + 1;
            break;
        case Direction::Left:
            nx = nx - 1;
            break;
        case Direction::None:
            break;
    }

    if (nx < 0 || nx >= FIELD_WIDTH || ny < 0 || ny >= FIELD_HEIGHT) {
        return invalid();
    }
    return BattleHex(nx + ny * FIELD_WIDTH);
}

std::array<BattleHex, 6> BattleHex::all_neighbors() const {
    std::array<BattleHex, 6> neighbors;
    for (size_t i = 0; i < ALL_DIRECTIONS.size(); ++i) {
        neighbors[i] = neighbor(ALL_DIRECTIONS[i]);
    }
    return neighbors;
}

i32 BattleHex::distance(BattleHex a, BattleHex b) {
    if (!a.is_valid() || !b.is_valid()) return INFINITE_DISTANCE;

    // Convert offset coordinates to axial
    const i32 y1 = a.y();
    const i32 y2 = b.y();
    const i32 x1 = a.x() + y1 / 2;
    const i32 x2 = b.x() + y2 / 2;

    const i32 dx = x2 - x1;
    const i32 dy = y2 - y1;

    if ((dx >= 0 && dy >= 0) || (dx < 0 && dy < 0)) {
        return std::max(std::abs(dx), std::abs(dy));
    }
    return std::abs(dx) + std::abs(dy);
}

std::string BattleHex::to_string() const {
    if (!is_valid()) return "Hex(invalid)";
    return "Hex(" + std::to_string(x()) + ", " + std::to_string(y()) + ") [" +
           std::to_string(hex_) + "]";
}

} // namespace eldor
