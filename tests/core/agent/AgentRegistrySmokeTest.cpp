#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <thread>
#include <vector>
#include "core/agent/AgentErrors.hpp"
#include "core/agent/AgentRegistry.hpp"

using namespace synapse::core;
using namespace synapse::core::agent;

NeuralConfiguration smallConfig() {
    NeuralConfiguration config;
    config.architecture = {3, 2, 1};
    return config;
}

void testInsertAndLookup() {
    std::cout << "Testing AgentRegistry insert/get...\n";

    memory::MemoryGovernor governor(1000, 10000);
    events::EventNotifier notifier;
    std::vector<events::AgentEvent> received;
    notifier.subscribe([&received](const events::AgentEvent& e) { received.push_back(e); });

    AgentRegistry registry(3, governor, notifier);
    assert(governor.reserve(500));
    registry.reserveCapacity();
    const std::string id = registry.insert(smallConfig(), 7, 500, 1.5);

    assert(id.rfind("agent_", 0) == 0);
    auto agent = registry.get(id);
    assert(agent);
    assert(agent->state == AgentState::Active);
    assert(agent->memoryUsage == 500);
    assert(agent->connectionStrength == 1.0);
    assert(agent->createdAt == agent->lastActive);
    assert(registry.size() == 1);
    assert(registry.activeAgents() == 1);
    assert(registry.totalSpawned() == 1);
    assert(registry.acquire(id)->network == 7);

    assert(received.size() == 1);
    assert(received[0].type == events::EventType::AgentSpawned);
    assert(received[0].payload["agentId"] == id);
    assert(received[0].payload["memoryUsage"] == 500);
    assert(received[0].payload["spawnTime"] == 1.5);

    assert(!registry.get("agent_missing"));
    assert(registry.find("agent_missing") == nullptr);
    bool notFound = false;
    try {
        registry.acquire("agent_missing");
    } catch (const NotFoundError& e) {
        notFound = e.agentId() == "agent_missing";
    }
    assert(notFound);

    std::cout << "[OK] AgentRegistry insert/get test\n";
}

void testCapacity() {
    std::cout << "Testing AgentRegistry capacity reservations...\n";

    memory::MemoryGovernor governor(1000, 10000);
    events::EventNotifier notifier;
    AgentRegistry registry(2, governor, notifier);

    registry.reserveCapacity();
    registry.reserveCapacity();
    // Незавершённые spawn тоже занимают место
    bool rejected = false;
    try {
        registry.reserveCapacity();
    } catch (const CapacityError&) {
        rejected = true;
    }
    assert(rejected);

    // Одно резервирование отменено, другое расходуется на вставку
    registry.releaseCapacity();
    registry.insert(smallConfig(), 1, 0, 0.0);
    assert(registry.size() == 1);
    registry.reserveCapacity();
    rejected = false;
    try {
        registry.reserveCapacity();
    } catch (const CapacityError&) {
        rejected = true;
    }
    assert(rejected);
    registry.releaseCapacity();
    registry.reserveCapacity();

    std::cout << "[OK] AgentRegistry capacity test\n";
}

void testTransitions() {
    std::cout << "Testing AgentRegistry transitions...\n";

    memory::MemoryGovernor governor(1000, 10000);
    events::EventNotifier notifier;
    AgentRegistry registry(4, governor, notifier);
    registry.reserveCapacity();
    const auto id = registry.insert(smallConfig(), 1, 0, 0.0);

    assert(registry.transition(id, {AgentState::Active}, AgentState::Learning) == AgentState::Active);
    assert(registry.get(id)->state == AgentState::Learning);
    assert(registry.activeAgents() == 0);

    bool conflict = false;
    try {
        registry.transition(id, {AgentState::Active}, AgentState::Learning);
    } catch (const StateConflictError&) {
        conflict = true;
    }
    assert(conflict);

    registry.completeLearning(id, 0.9);
    assert(registry.get(id)->state == AgentState::Active);
    assert(registry.get(id)->learningProgress == 0.9);

    assert(registry.markError(id));
    assert(registry.get(id)->state == AgentState::Error);
    assert(!registry.markError(id));

    bool notFound = false;
    try {
        registry.transition("agent_none", {AgentState::Active}, AgentState::Learning);
    } catch (const NotFoundError&) {
        notFound = true;
    }
    assert(notFound);

    std::cout << "[OK] AgentRegistry transition test\n";
}

void testTerminationRequests() {
    std::cout << "Testing AgentRegistry termination requests...\n";

    memory::MemoryGovernor governor(1000, 10000);
    events::EventNotifier notifier;
    AgentRegistry registry(4, governor, notifier);

    auto unknown = registry.requestTermination("agent_none");
    assert(unknown.status == TerminationStatus::NotFound);
    assert(unknown.done.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);

    // Active: сразу Terminating, повторная заявка ждёт того же удаления
    registry.reserveCapacity();
    const auto idle = registry.insert(smallConfig(), 1, 0, 0.0);
    auto first = registry.requestTermination(idle);
    assert(first.status == TerminationStatus::Started);
    assert(registry.get(idle)->state == AgentState::Terminating);
    auto second = registry.requestTermination(idle);
    assert(second.status == TerminationStatus::Pending);
    assert(first.done.wait_for(std::chrono::milliseconds(0)) == std::future_status::timeout);
    assert(registry.remove(idle));
    first.done.get();
    second.done.get();

    // Learning: удаление откладывается, новое обучение после заявки отклоняется
    registry.reserveCapacity();
    const auto busy = registry.insert(smallConfig(), 2, 0, 0.0);
    registry.transition(busy, {AgentState::Active}, AgentState::Learning);
    assert(!registry.claimDeferredTermination(busy));
    auto deferred = registry.requestTermination(busy);
    assert(deferred.status == TerminationStatus::Deferred);
    assert(registry.get(busy)->state == AgentState::Learning);

    registry.completeLearning(busy, 0.5);
    assert(registry.get(busy)->state == AgentState::Active);
    bool conflict = false;
    try {
        registry.transition(busy, {AgentState::Active}, AgentState::Learning);
    } catch (const StateConflictError&) {
        conflict = true;
    }
    assert(conflict);
    assert(registry.requestTermination(busy).status == TerminationStatus::Pending);

    assert(registry.claimDeferredTermination(busy));
    assert(registry.get(busy)->state == AgentState::Terminating);
    assert(!registry.claimDeferredTermination(busy));
    registry.remove(busy);
    assert(deferred.done.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);

    std::cout << "[OK] AgentRegistry termination request test\n";
}

void testActiveFilterAndLateCalls() {
    std::cout << "Testing AgentRegistry state filter and late calls...\n";

    memory::MemoryGovernor governor(1000, 10000);
    events::EventNotifier notifier;
    AgentRegistry registry(4, governor, notifier);
    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        registry.reserveCapacity();
        ids.push_back(registry.insert(smallConfig(), static_cast<kernel::NetworkHandle>(i + 1), 0, 0.0));
    }
    registry.transition(ids[1], {AgentState::Active}, AgentState::Learning);
    registry.markError(ids[2]);

    assert(registry.list().size() == 3);
    auto active = registry.list(AgentState::Active);
    assert(active.size() == 1);
    assert(active[0].id == ids[0]);

    // Exclusive-доступ ждёт возврата отменённого вызова ядра
    auto slot = registry.acquire(ids[0]);
    slot->beginLateCall();
    auto writer = std::async(std::launch::async, [slot]() { auto gate = slot->lockExclusive(); });
    assert(writer.wait_for(std::chrono::milliseconds(40)) == std::future_status::timeout);
    slot->endLateCall();
    assert(writer.wait_for(std::chrono::seconds(2)) == std::future_status::ready);

    std::cout << "[OK] AgentRegistry state filter test\n";
}

void testRecordInference() {
    std::cout << "Testing AgentRegistry inference counters...\n";

    memory::MemoryGovernor governor(1000, 10000);
    events::EventNotifier notifier;
    AgentRegistry registry(4, governor, notifier);
    registry.reserveCapacity();
    const auto id = registry.insert(smallConfig(), 1, 0, 0.0);

    registry.recordInference(id, 10.0);
    registry.recordInference(id, 20.0);
    registry.recordInference(id, 30.0);
    auto agent = registry.get(id);
    assert(agent->totalInferences == 3);
    assert(agent->averageInferenceTime > 19.999 && agent->averageInferenceTime < 20.001);

    // Параллельные обновления не теряются
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, &id]() {
            for (int i = 0; i < 250; ++i) registry.recordInference(id, 20.0);
        });
    }
    for (auto& t : threads) t.join();
    assert(registry.get(id)->totalInferences == 1003);

    // Неизвестный id игнорируется
    registry.recordInference("agent_none", 1.0);

    std::cout << "[OK] AgentRegistry inference counters test\n";
}

void testRemove() {
    std::cout << "Testing AgentRegistry remove...\n";

    memory::MemoryGovernor governor(1000, 10000);
    events::EventNotifier notifier;
    int terminated = 0;
    notifier.subscribe([&terminated](const events::AgentEvent& e) {
        if (e.type == events::EventType::AgentTerminated) ++terminated;
    });
    AgentRegistry registry(4, governor, notifier);

    assert(governor.reserve(300));
    registry.reserveCapacity();
    const auto id = registry.insert(smallConfig(), 1, 300, 0.0);
    auto slot = registry.acquire(id);
    assert(governor.totalReserved() == 300);

    assert(registry.remove(id));
    assert(slot->removed.load());
    assert(governor.totalReserved() == 0);
    assert(terminated == 1);
    assert(!registry.get(id));

    // Повторное удаление и неизвестный id: без события
    assert(!registry.remove(id));
    assert(!registry.remove("agent_never"));
    assert(terminated == 1);
    assert(registry.totalSpawned() == 1);

    std::cout << "[OK] AgentRegistry remove test\n";
}

int main() {
    try {
        testInsertAndLookup();
        testCapacity();
        testTransitions();
        testTerminationRequests();
        testActiveFilterAndLateCalls();
        testRecordInference();
        testRemove();
        std::cout << "All AgentRegistry tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "AgentRegistry test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
