#pragma once
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/agent/AgentTypes.hpp"
#include "core/events/EventNotifier.hpp"
#include "core/kernel/ComputeKernel.hpp"
#include "core/memory/MemoryGovernor.hpp"

namespace synapse {
namespace core {
namespace agent {

using StateSet = std::vector<AgentState>;

// AgentSlot: запись реестра вместе с сетью ядра и замком агента.
// agent, terminationRequested и terminationWaiters меняются только под мьютексом реестра.
// gate: инференс держит shared, обучение/передача знаний/удаление: exclusive.
struct AgentSlot {
    NeuralAgent agent;
    kernel::NetworkHandle network = kernel::kInvalidNetwork;
    std::shared_timed_mutex gate;
    std::atomic<bool> removed{false};
    bool terminationRequested = false; // Удаление отложено до конца обучения
    std::vector<std::promise<void>> terminationWaiters;

    // Вызовы ядра, брошенные по таймауту и ещё не вернувшиеся.
    // Пока они идут, exclusive-доступ к сети не выдаётся.
    void beginLateCall();
    void endLateCall();
    std::unique_lock<std::shared_timed_mutex> lockExclusive();
private:
    std::mutex lateMutex_;
    std::condition_variable lateDone_;
    size_t lateCalls_ = 0;
};

enum class TerminationStatus {
    NotFound, // Агента нет, future уже готов
    Started,  // Агент переведён в Terminating, удаление за вызывающим
    Deferred, // Идёт обучение, агент будет удалён по его завершении
    Pending   // Удаление уже запущено другим вызовом
};

struct TerminationTicket {
    TerminationStatus status = TerminationStatus::NotFound;
    std::future<void> done; // Готов, когда запись удалена
};

// AgentRegistry: единственный источник истины о существовании и состоянии агентов
class AgentRegistry {
public:
    AgentRegistry(size_t maxAgents, memory::MemoryGovernor& memory, events::EventNotifier& events);
    AgentRegistry(const AgentRegistry&) = delete;
    AgentRegistry& operator=(const AgentRegistry&) = delete;

    // Место под новый агент (учитываются и незавершённые spawn). CapacityError, если пул полон.
    void reserveCapacity();
    void releaseCapacity();

    // Регистрирует агента, созданного ядром, расходуя резерв reserveCapacity().
    // Агент становится Active, рассылается agentSpawned.
    std::string insert(const NeuralConfiguration& config, kernel::NetworkHandle network,
                       size_t memoryUsage, double spawnTimeMs);

    std::optional<NeuralAgent> get(const std::string& id) const;
    std::shared_ptr<AgentSlot> find(const std::string& id) const;    // nullptr, если нет
    std::shared_ptr<AgentSlot> acquire(const std::string& id) const; // NotFoundError, если нет
    std::vector<NeuralAgent> list() const;
    std::vector<NeuralAgent> list(AgentState state) const; // Только агенты в состоянии state
    std::vector<std::string> ids() const;
    size_t activeAgents() const; // В состоянии Active
    size_t size() const;
    size_t maxAgents() const { return maxAgents_; }
    uint64_t totalSpawned() const;

    // Атомарная смена состояния; возвращает предыдущее.
    // NotFoundError, если агента нет; StateConflictError, если состояние не из from.
    AgentState transition(const std::string& id, const StateSet& from, AgentState to);

    // Заявка на удаление: Active/Error сразу переходят в Terminating,
    // Learning помечается и переводится после обучения (claimDeferredTermination).
    // Пока заявка висит, новое обучение отклоняется.
    TerminationTicket requestTermination(const std::string& id);
    bool claimDeferredTermination(const std::string& id); // true: агент переведён в Terminating

    void recordInference(const std::string& id, double elapsedMs);
    void completeLearning(const std::string& id, double accuracy); // Learning -> Active
    bool markError(const std::string& id);

    // Удаление записи: освобождает память, рассылает agentTerminated, будит ждущих удаления.
    // false для неизвестного id (без события).
    bool remove(const std::string& id);
private:
    std::string generateId();
    void setState(AgentSlot& slot, AgentState to);

    const size_t maxAgents_;
    memory::MemoryGovernor& memory_;
    events::EventNotifier& events_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<AgentSlot>> agents_;
    size_t pending_ = 0;
    uint64_t totalSpawned_ = 0;
    std::mt19937_64 rng_;
};

} // namespace agent
} // namespace core
} // namespace synapse
