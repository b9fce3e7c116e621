#include <atomic>
#include <cassert>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>
#include "core/memory/MemoryGovernor.hpp"

using synapse::core::memory::MemoryGovernor;

void testFootprintEstimate() {
    std::cout << "Testing MemoryGovernor footprint estimate...\n";

    // [10, 5, 1]: 10*5 + 5 + 5*1 + 1 = 61 параметр
    assert(MemoryGovernor::parameterCount({10, 5, 1}) == 61);
    assert(MemoryGovernor::estimateFootprint({10, 5, 1}) == 61 * 4 * sizeof(float) + 64 * 1024);

    // Один слой: параметров нет, только накладные расходы
    assert(MemoryGovernor::parameterCount({7}) == 0);
    assert(MemoryGovernor::estimateFootprint({7}) == 64 * 1024);

    // Монотонность по числу параметров
    assert(MemoryGovernor::estimateFootprint({10, 20, 1}) > MemoryGovernor::estimateFootprint({10, 5, 1}));

    std::cout << "[OK] MemoryGovernor footprint test\n";
}

void testFootprintSaturation() {
    std::cout << "Testing MemoryGovernor overflow saturation...\n";

    const size_t huge = std::numeric_limits<size_t>::max() / 2;
    assert(MemoryGovernor::parameterCount({huge, huge}) == std::numeric_limits<size_t>::max());
    assert(MemoryGovernor::estimateFootprint({huge, huge}) == std::numeric_limits<size_t>::max());
    assert(MemoryGovernor::estimateFootprint({1u << 20, 1u << 20, 1u << 20}) > (size_t{1} << 40));

    MemoryGovernor governor(1024 * 1024, 4 * 1024 * 1024);
    assert(!governor.reserve(MemoryGovernor::estimateFootprint({huge, huge})));
    assert(governor.totalReserved() == 0);

    std::cout << "[OK] MemoryGovernor saturation test\n";
}

void testReserveRelease() {
    std::cout << "Testing MemoryGovernor reserve/release...\n";

    MemoryGovernor governor(100, 250);
    assert(governor.perAgentLimit() == 100);
    assert(governor.aggregateLimit() == 250);

    assert(!governor.reserve(101)); // Больше лимита агента
    assert(governor.reserve(100));
    assert(governor.reserve(100));
    assert(!governor.reserve(100)); // Пул переполнится
    assert(governor.reserve(50));
    assert(governor.totalReserved() == 250);
    assert(governor.pressure() == 1.0);

    governor.release(100);
    assert(governor.totalReserved() == 150);

    // Освобождение больше зарезервированного не уводит в минус
    governor.release(1000);
    assert(governor.totalReserved() == 0);
    assert(governor.pressure() == 0.0);

    assert(governor.reserve(80));
    governor.releaseAll();
    assert(governor.totalReserved() == 0);

    std::cout << "[OK] MemoryGovernor reserve/release test\n";
}

void testConcurrentReservations() {
    std::cout << "Testing MemoryGovernor concurrent reservations...\n";

    MemoryGovernor governor(10, 1000);
    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&governor, &granted]() {
            for (int i = 0; i < 50; ++i) {
                if (governor.reserve(10)) granted++;
            }
        });
    }
    for (auto& t : threads) t.join();

    // Ровно 100 резервов по 10 байт помещаются в пул
    assert(granted == 100);
    assert(governor.totalReserved() == 1000);

    std::cout << "[OK] MemoryGovernor concurrency test\n";
}

int main() {
    try {
        testFootprintEstimate();
        testFootprintSaturation();
        testReserveRelease();
        testConcurrentReservations();
        std::cout << "All MemoryGovernor tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "MemoryGovernor test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
