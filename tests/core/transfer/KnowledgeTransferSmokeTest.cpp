#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/agent/AgentErrors.hpp"
#include "core/support/MockComputeKernel.hpp"
#include "core/transfer/KnowledgeTransfer.hpp"

using namespace synapse::core;
using namespace std::chrono_literals;
using transfer::KnowledgeTransfer;

template <typename Error, typename F>
bool throwsAs(F&& f) {
    try {
        f();
    } catch (const Error&) {
        return true;
    }
    return false;
}

struct TransferFixture {
    explicit TransferFixture(bool enabled = true)
        : transfer(registry, kernel, monitor, notifier, pool, enabled, 0.1) {}

    memory::MemoryGovernor governor{1 << 20, 1 << 24};
    events::EventNotifier notifier;
    agent::AgentRegistry registry{8, governor, notifier};
    testing::MockComputeKernel kernel;
    metrics::PerformanceMonitor monitor{registry, governor, kernel, 100ms};
    thread::ThreadPool pool{thread::ThreadPoolConfig{4, 8, 1024, "transfer-test"}};
    KnowledgeTransfer transfer;

    std::string spawn(std::vector<size_t> arch = {3, 5, 2}) {
        agent::NeuralConfiguration config;
        config.architecture = std::move(arch);
        const auto handle = kernel.createNetwork(config).get();
        registry.reserveCapacity();
        return registry.insert(config, handle, 0, 1.0);
    }

    kernel::NetworkHandle handleOf(const std::string& id) { return registry.acquire(id)->network; }
};

void testChecksum() {
    std::cout << "Testing KnowledgeTransfer checksum...\n";

    const std::string abc = "abc";
    assert(KnowledgeTransfer::checksum(std::vector<uint8_t>(abc.begin(), abc.end())) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(KnowledgeTransfer::checksum({}) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    std::cout << "[OK] KnowledgeTransfer checksum test\n";
}

void testShareSuccess() {
    std::cout << "Testing KnowledgeTransfer share...\n";

    TransferFixture f;
    std::vector<events::AgentEvent> shared;
    f.notifier.subscribe([&shared](const events::AgentEvent& e) {
        if (e.type == events::EventType::KnowledgeShared) shared.push_back(e);
    });
    const auto source = f.spawn();
    const auto a = f.spawn();
    const auto b = f.spawn();

    f.transfer.share(source, {b, a}).get();
    assert(f.kernel.serializeCalls == 1);
    auto log = f.kernel.deserializeLog();
    assert(log.size() == 2);
    // Порядок применения совпадает с порядком целей
    assert(log[0].first == f.handleOf(b));
    assert(log[1].first == f.handleOf(a));
    assert(log[0].second == 0.1);

    assert(shared.size() == 1);
    const auto& payload = shared[0].payload;
    assert(payload["sourceAgentId"] == source);
    assert(payload["targetAgentIds"].size() == 2);
    assert(payload["targetAgentIds"][0] == b);
    assert(payload["timestamp"].get<int64_t>() > 0);

    const auto weights = f.kernel.serializeWeights(f.handleOf(source)).get();
    assert(payload["payloadSize"] == weights.size());
    assert(payload["payloadChecksum"] == KnowledgeTransfer::checksum(weights));

    // Повторы в списке целей применяются при каждом вхождении
    f.transfer.share(source, {a, a}).get();
    assert(f.kernel.deserializeLog().size() == 4);

    std::cout << "[OK] KnowledgeTransfer share test\n";
}

void testRejectionsBeforeKernel() {
    std::cout << "Testing KnowledgeTransfer rejections...\n";

    {
        TransferFixture disabled(false);
        const auto source = disabled.spawn();
        const auto target = disabled.spawn();
        assert(!disabled.transfer.enabled());
        assert(throwsAs<agent::FeatureDisabledError>([&]() { disabled.transfer.share(source, {target}); }));
        assert(disabled.kernel.serializeCalls == 0);
        assert(disabled.kernel.deserializeCalls == 0);
    }

    TransferFixture f;
    const auto source = f.spawn();
    const auto target = f.spawn();
    const auto wide = f.spawn({3, 9, 2});

    assert(throwsAs<agent::NotFoundError>([&]() { f.transfer.share("agent_ghost", {target}); }));
    // Одна неизвестная цель отменяет всю передачу
    assert(throwsAs<agent::NotFoundError>([&]() { f.transfer.share(source, {target, "agent_ghost"}); }));
    assert(throwsAs<agent::ConfigurationError>([&]() { f.transfer.share(source, {target, wide}); }));

    f.registry.markError(target);
    const auto other = f.spawn();
    assert(throwsAs<agent::StateConflictError>([&]() { f.transfer.share(source, {other, target}); }));

    assert(f.kernel.serializeCalls == 0);
    assert(f.kernel.deserializeCalls == 0);

    std::cout << "[OK] KnowledgeTransfer rejection test\n";
}

void testSourceAmongTargets() {
    std::cout << "Testing KnowledgeTransfer source among targets...\n";

    TransferFixture f;
    std::vector<events::AgentEvent> shared;
    f.notifier.subscribe([&shared](const events::AgentEvent& e) {
        if (e.type == events::EventType::KnowledgeShared) shared.push_back(e);
    });
    const auto source = f.spawn();
    const auto target = f.spawn();

    // Только источник или пустой список: ядро не вызывается, событие всё равно есть
    f.transfer.share(source, {source}).get();
    f.transfer.share(source, {}).get();
    assert(f.kernel.serializeCalls == 0);
    assert(shared.size() == 2);
    assert(shared[0].payload["sourceAgentId"] == source);
    assert(shared[0].payload["targetAgentIds"] == nlohmann::json::array({source}));
    assert(shared[0].payload["payloadSize"] == 0);
    assert(shared[1].payload["targetAgentIds"].empty());

    // В событии список вызывающего, веса получает только настоящая цель
    f.transfer.share(source, {source, target}).get();
    auto log = f.kernel.deserializeLog();
    assert(log.size() == 1);
    assert(log[0].first == f.handleOf(target));
    assert(shared.size() == 3);
    assert(shared[2].payload["targetAgentIds"] == nlohmann::json::array({source, target}));

    std::cout << "[OK] KnowledgeTransfer source skip test\n";
}

void testKernelFailure() {
    std::cout << "Testing KnowledgeTransfer kernel failure...\n";

    TransferFixture f;
    const auto source = f.spawn();
    const auto target = f.spawn();

    f.kernel.failNextDeserialize(1, false);
    assert(throwsAs<agent::KernelError>([&]() { f.transfer.share(source, {target}).get(); }));
    assert(f.registry.get(target)->state == agent::AgentState::Error);
    assert(f.registry.get(source)->state == agent::AgentState::Active);
    assert(f.monitor.snapshot().totalErrors == 1);

    std::cout << "[OK] KnowledgeTransfer kernel failure test\n";
}

void testOpposingTransfers() {
    std::cout << "Testing KnowledgeTransfer opposing transfers...\n";

    TransferFixture f;
    const auto a = f.spawn();
    const auto b = f.spawn();

    // a -> b и b -> a одновременно не взаимоблокируются
    std::vector<std::future<void>> transfers;
    for (int i = 0; i < 20; ++i) {
        transfers.push_back(f.transfer.share(a, {b}));
        transfers.push_back(f.transfer.share(b, {a}));
    }
    for (auto& t : transfers) {
        assert(t.wait_for(5s) == std::future_status::ready);
        t.get();
    }
    assert(f.kernel.deserializeLog().size() == 40);

    std::cout << "[OK] KnowledgeTransfer opposing transfer test\n";
}

int main() {
    spdlog::set_level(spdlog::level::err);
    try {
        testChecksum();
        testShareSuccess();
        testRejectionsBeforeKernel();
        testSourceAmongTargets();
        testKernelFailure();
        testOpposingTransfers();
        std::cout << "All KnowledgeTransfer tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "KnowledgeTransfer test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
