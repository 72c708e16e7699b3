#undef NDEBUG
#include "core/hex.hpp"
#include <iostream>
#include <cassert>

using namespace eldor;

void test_index_and_coords() {
    BattleHex hex(5, 3);
    assert(hex.x() == 5);
    assert(hex.y() == 3);
    assert(hex.value() == 5 + 3 * FIELD_WIDTH);

    BattleHex raw(186);
    assert(raw.is_valid());
    assert(raw.x() == 16 && raw.y() == 10);

    assert(!BattleHex(187).is_valid());
    assert(!BattleHex(-1).is_valid());
    assert(!BattleHex().is_valid());
    std::cout << "[PASS] test_index_and_coords" << std::endl;
}

void test_available_excludes_hero_columns() {
    assert(!BattleHex(0, 5).is_available());
    assert(!BattleHex(16, 5).is_available());
    assert(BattleHex(1, 5).is_available());
    assert(BattleHex(15, 5).is_available());
    assert(BattleHex(BattleHex::HERO_ATTACKER).x() == 0);
    assert(BattleHex(BattleHex::HERO_DEFENDER).x() == 16);
    std::cout << "[PASS] test_available_excludes_hero_columns" << std::endl;
}

void test_out_of_range_coords_are_clamped() {
    BattleHex hex(20, -3);
    assert(hex.is_valid());
    assert(hex.x() == FIELD_WIDTH - 1);
    assert(hex.y() == 0);

    BattleHex moved(4, 4);
    moved.set_xy(-2, 50);
    assert(moved.x() == 0 && moved.y() == FIELD_HEIGHT - 1);
    std::cout << "[PASS] test_out_of_range_coords_are_clamped" << std::endl;
}

void test_neighbors_are_adjacent() {
    for (i32 y = 1; y < FIELD_HEIGHT - 1; ++y) {
        for (i32 x = 1; x < FIELD_WIDTH - 1; ++x) {
            BattleHex hex(x, y);
            auto neighbors = hex.all_neighbors();
            assert(neighbors.size() == 6);
            for (const auto& n : neighbors) {
                assert(n.is_valid());
                assert(BattleHex::distance(hex, n) == 1);
                assert(hex.is_adjacent_to(n));
            }
        }
    }
    std::cout << "[PASS] test_neighbors_are_adjacent" << std::endl;
}

void test_neighbor_offsets() {
    // Even row
    BattleHex even(5, 2);
    assert(even.neighbor(BattleHex::Direction::TopLeft) == BattleHex(5, 1));
    assert(even.neighbor(BattleHex::Direction::TopRight) == BattleHex(6, 1));
    assert(even.neighbor(BattleHex::Direction::BottomRight) == BattleHex(6, 3));
    assert(even.neighbor(BattleHex::Direction::BottomLeft) == BattleHex(5, 3));

    // Odd row
    BattleHex odd(5, 3);
    assert(odd.neighbor(BattleHex::Direction::TopLeft) == BattleHex(4, 2));
    assert(odd.neighbor(BattleHex::Direction::TopRight) == BattleHex(5, 2));
    assert(odd.neighbor(BattleHex::Direction::Right) == BattleHex(6, 3));
    assert(odd.neighbor(BattleHex::Direction::Left) == BattleHex(4, 3));

    assert(odd.neighbor(BattleHex::Direction::None) == odd);
    std::cout << "[PASS] test_neighbor_offsets" << std::endl;
}

void test_edge_neighbors_are_invalid() {
    BattleHex corner(0, 0);
    assert(!corner.neighbor(BattleHex::Direction::Left).is_valid());
    assert(!corner.neighbor(BattleHex::Direction::TopLeft).is_valid());
    assert(!corner.neighbor(BattleHex::Direction::TopRight).is_valid());
    assert(corner.neighbor(BattleHex::Direction::Right).is_valid());

    int invalid = 0;
    for (const auto& n : corner.all_neighbors()) {
        if (!n.is_valid()) invalid++;
    }
    assert(invalid == 3);

    assert(!BattleHex::invalid().neighbor(BattleHex::Direction::Right).is_valid());
    std::cout << "[PASS] test_edge_neighbors_are_invalid" << std::endl;
}

void test_distance_properties() {
    for (i32 a = 0; a < FIELD_SIZE; a += 7) {
        for (i32 b = 0; b < FIELD_SIZE; b += 5) {
            const i32 ab = BattleHex::distance(BattleHex(a), BattleHex(b));
            const i32 ba = BattleHex::distance(BattleHex(b), BattleHex(a));
            assert(ab == ba);
            assert((ab == 0) == (a == b));
        }
    }

    assert(BattleHex::distance(BattleHex(1, 5), BattleHex(15, 5)) == 14);
    assert(BattleHex::distance(BattleHex(3, 0), BattleHex(3, 4)) == 4);
    std::cout << "[PASS] test_distance_properties" << std::endl;
}

void test_invalid_distance_is_infinite() {
    assert(BattleHex::distance(BattleHex::invalid(), BattleHex(3, 3)) == BattleHex::INFINITE_DISTANCE);
    assert(BattleHex::distance(BattleHex(3, 3), BattleHex(500)) == BattleHex::INFINITE_DISTANCE);
    assert(!BattleHex::invalid().is_adjacent_to(BattleHex(3, 3)));
    std::cout << "[PASS] test_invalid_distance_is_infinite" << std::endl;
}

void test_to_string() {
    assert(BattleHex(2, 1).to_string() == "Hex(2, 1) [19]");
    assert(BattleHex::invalid().to_string() == "Hex(invalid)");
    std::cout << "[PASS] test_to_string" << std::endl;
}

int main() {
    std::cout << "=== Hex Tests ===" << std::endl;

    test_index_and_coords();
    test_available_excludes_hero_columns();
    test_out_of_range_coords_are_clamped();
    test_neighbors_are_adjacent();
    test_neighbor_offsets();
    test_edge_neighbors_are_invalid();
    test_distance_properties();
    test_invalid_distance_is_infinite();
    test_to_string();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
