#include "engine/dice.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <algorithm>

using namespace eldor;

int main() {
    std::cout << "=== Dice Benchmarks ===" << std::endl;
    std::cout << std::endl;

    DiceRoller roller(12345);

    // Benchmark raw 64-bit draws
    {
        const u64 iterations = 100'000'000;
        auto start = std::chrono::high_resolution_clock::now();

        u64 sum = 0;
        for (u64 i = 0; i < iterations; ++i) {
            sum += roller.next() & 0xff;
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        double draws_per_sec = iterations * 1000.0 / std::max<i64>(1, duration.count());

        std::cout << "Raw Draws:" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(2)
                  << draws_per_sec / 1e6 << " million/sec" << std::endl;
        std::cout << "  (Sum: " << sum << ")" << std::endl;
        std::cout << std::endl;
    }

    // Benchmark damage rolls over a stack-sized range
    {
        const u64 iterations = 50'000'000;
        auto start = std::chrono::high_resolution_clock::now();

        i64 total = 0;
        for (u64 i = 0; i < iterations; ++i) {
            total += roller.roll_range(20, 60);
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        double rolls_per_sec = iterations * 1000.0 / std::max<i64>(1, duration.count());

        std::cout << "Damage Rolls (20-60):" << std::endl;
        std::cout << "  Iterations: " << iterations << std::endl;
        std::cout << "  Time: " << duration.count() << " ms" << std::endl;
        std::cout << "  Rate: " << std::fixed << std::setprecision(2)
                  << rolls_per_sec / 1e6 << " million/sec" << std::endl;
        std::cout << "  Avg roll: " << std::setprecision(2)
                  << static_cast<double>(total) / iterations << std::endl;
        std::cout << std::endl;
    }

    return 0;
}
