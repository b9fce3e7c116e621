#include "core/events/EventNotifier.hpp"
#include <vector>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace events {

const char* toString(EventType type) {
    switch (type) {
        case EventType::Initialized: return "initialized";
        case EventType::AgentSpawned: return "agentSpawned";
        case EventType::InferenceComplete: return "inferenceComplete";
        case EventType::LearningComplete: return "learningComplete";
        case EventType::KnowledgeShared: return "knowledgeShared";
        case EventType::AgentTerminated: return "agentTerminated";
        case EventType::Cleanup: return "cleanup";
        case EventType::Error: return "error";
    }
    return "unknown";
}

SubscriptionId EventNotifier::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    const SubscriptionId id = nextId_++;
    subscribers_.emplace(id, std::move(callback));
    spdlog::debug("[Events] подписчик {} добавлен", id);
    return id;
}

bool EventNotifier::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    return subscribers_.erase(id) > 0;
}

void EventNotifier::notify(EventType type, nlohmann::json payload) {
    AgentEvent event{type, std::move(payload), std::chrono::system_clock::now()};

    // deliveryMutex_ упорядочивает доставку между потоками
    std::lock_guard<std::recursive_mutex> delivery(deliveryMutex_);
    std::vector<std::pair<SubscriptionId, EventCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(subscribersMutex_);
        targets.assign(subscribers_.begin(), subscribers_.end());
        ++delivered_;
    }
    spdlog::debug("[Events] {} -> {} подписчиков", toString(type), targets.size());
    for (const auto& [id, callback] : targets) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            spdlog::error("[Events] подписчик {} упал на событии {}: {}", id, toString(type), e.what());
        }
    }
}

void EventNotifier::clear() {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    subscribers_.clear();
}

size_t EventNotifier::subscriberCount() const {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    return subscribers_.size();
}

uint64_t EventNotifier::deliveredCount() const {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    return delivered_;
}

} // namespace events
} // namespace core
} // namespace synapse
