#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace synapse {
namespace core {
namespace events {

// Типы событий жизненного цикла
enum class EventType {
    Initialized,
    AgentSpawned,
    InferenceComplete,
    LearningComplete,
    KnowledgeShared,
    AgentTerminated,
    Cleanup,
    Error
};

const char* toString(EventType type);

struct AgentEvent {
    EventType type;
    nlohmann::json payload;
    std::chrono::system_clock::time_point timestamp;
};

using EventCallback = std::function<void(const AgentEvent&)>;
using SubscriptionId = uint64_t;

// EventNotifier: единственный внешний канал уведомлений.
// Доставка синхронная и строго в порядке возникновения событий.
class EventNotifier {
public:
    EventNotifier() = default;
    EventNotifier(const EventNotifier&) = delete;
    EventNotifier& operator=(const EventNotifier&) = delete;

    SubscriptionId subscribe(EventCallback callback); // Подписка
    bool unsubscribe(SubscriptionId id);              // Отписка, false если id неизвестен
    void notify(EventType type, nlohmann::json payload = nlohmann::json::object()); // Разослать событие
    void clear();                                     // Удалить всех подписчиков
    size_t subscriberCount() const;
    uint64_t deliveredCount() const;                  // Всего разослано событий
private:
    mutable std::mutex subscribersMutex_;
    std::recursive_mutex deliveryMutex_; // Подписчик может сам вызвать notify
    std::map<SubscriptionId, EventCallback> subscribers_;
    SubscriptionId nextId_ = 1;
    uint64_t delivered_ = 0;
};

} // namespace events
} // namespace core
} // namespace synapse
