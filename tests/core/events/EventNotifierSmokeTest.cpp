#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "core/events/EventNotifier.hpp"

using namespace synapse::core::events;

void testSubscribeAndOrder() {
    std::cout << "Testing EventNotifier ordered delivery...\n";

    EventNotifier notifier;
    std::vector<EventType> received;
    auto id = notifier.subscribe([&received](const AgentEvent& e) { received.push_back(e.type); });
    assert(notifier.subscriberCount() == 1);

    notifier.notify(EventType::Initialized);
    notifier.notify(EventType::AgentSpawned, {{"agentId", "a"}});
    notifier.notify(EventType::AgentTerminated, {{"agentId", "a"}});

    assert(received.size() == 3);
    assert(received[0] == EventType::Initialized);
    assert(received[1] == EventType::AgentSpawned);
    assert(received[2] == EventType::AgentTerminated);
    assert(notifier.deliveredCount() == 3);

    assert(notifier.unsubscribe(id));
    assert(!notifier.unsubscribe(id));
    notifier.notify(EventType::Cleanup);
    assert(received.size() == 3);

    std::cout << "[OK] EventNotifier order test\n";
}

void testPayloadAndNames() {
    std::cout << "Testing EventNotifier payloads...\n";

    EventNotifier notifier;
    AgentEvent last{EventType::Error, nullptr, {}};
    notifier.subscribe([&last](const AgentEvent& e) { last = e; });
    notifier.notify(EventType::InferenceComplete, {{"agentId", "x"}, {"outputSize", 3}});
    assert(last.type == EventType::InferenceComplete);
    assert(last.payload["agentId"] == "x");
    assert(last.payload["outputSize"] == 3);
    assert(last.timestamp.time_since_epoch().count() > 0);

    assert(std::string(toString(EventType::Initialized)) == "initialized");
    assert(std::string(toString(EventType::AgentSpawned)) == "agentSpawned");
    assert(std::string(toString(EventType::InferenceComplete)) == "inferenceComplete");
    assert(std::string(toString(EventType::LearningComplete)) == "learningComplete");
    assert(std::string(toString(EventType::KnowledgeShared)) == "knowledgeShared");
    assert(std::string(toString(EventType::AgentTerminated)) == "agentTerminated");
    assert(std::string(toString(EventType::Cleanup)) == "cleanup");
    assert(std::string(toString(EventType::Error)) == "error");

    std::cout << "[OK] EventNotifier payload test\n";
}

void testSubscriberIsolation() {
    std::cout << "Testing EventNotifier subscriber isolation...\n";

    EventNotifier notifier;
    int calls = 0;
    notifier.subscribe([](const AgentEvent&) { throw std::runtime_error("subscriber failure"); });
    notifier.subscribe([&calls](const AgentEvent&) { ++calls; });

    notifier.notify(EventType::Error, {{"error", "x"}});
    notifier.notify(EventType::Cleanup);
    assert(calls == 2);

    std::cout << "[OK] EventNotifier isolation test\n";
}

void testReentrantNotify() {
    std::cout << "Testing EventNotifier reentrant notify...\n";

    EventNotifier notifier;
    std::vector<EventType> received;
    notifier.subscribe([&](const AgentEvent& e) {
        received.push_back(e.type);
        if (e.type == EventType::AgentTerminated) {
            notifier.notify(EventType::Cleanup);
        }
    });
    notifier.notify(EventType::AgentTerminated);
    assert(received.size() == 2);
    assert(received[1] == EventType::Cleanup);

    notifier.clear();
    assert(notifier.subscriberCount() == 0);

    std::cout << "[OK] EventNotifier reentrant test\n";
}

void testConcurrentNotify() {
    std::cout << "Testing EventNotifier concurrent notify...\n";

    EventNotifier notifier;
    int delivered = 0; // Доставка сериализована, поэтому без atomic
    notifier.subscribe([&delivered](const AgentEvent&) { ++delivered; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&notifier]() {
            for (int i = 0; i < 100; ++i) notifier.notify(EventType::InferenceComplete);
        });
    }
    for (auto& t : threads) t.join();
    assert(delivered == 400);

    std::cout << "[OK] EventNotifier concurrency test\n";
}

int main() {
    try {
        testSubscribeAndOrder();
        testPayloadAndNames();
        testSubscriberIsolation();
        testReentrantNotify();
        testConcurrentNotify();
        std::cout << "All EventNotifier tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "EventNotifier test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
