#pragma once
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "core/agent/AgentRegistry.hpp"
#include "core/agent/AgentTypes.hpp"
#include "core/agent/ManagerConfig.hpp"
#include "core/events/EventNotifier.hpp"
#include "core/inference/InferenceScheduler.hpp"
#include "core/kernel/ComputeKernel.hpp"
#include "core/memory/MemoryGovernor.hpp"
#include "core/metrics/PerformanceMonitor.hpp"
#include "core/thread/ThreadPool.hpp"
#include "core/training/TrainingCoordinator.hpp"
#include "core/transfer/KnowledgeTransfer.hpp"

namespace synapse {
namespace core {
namespace agent {

// NeuralAgentManager. Фасад: ограниченный пул нейро-агентов поверх вычислительного ядра.
// Проверки выполняются в вызывающем потоке, работа в пуле менеджера.
// Ошибки проверки бросаются сразу, ошибки выполнения приходят из future.
class NeuralAgentManager {
public:
    NeuralAgentManager(const NeuralAgentManagerConfig& config, std::shared_ptr<kernel::IComputeKernel> kernel);
    ~NeuralAgentManager();
    NeuralAgentManager(const NeuralAgentManager&) = delete;
    NeuralAgentManager& operator=(const NeuralAgentManager&) = delete;

    bool initialize(); // Инициализация, false при некорректной конфигурации
    bool isInitialized() const;

    std::future<std::string> spawnAgent(const NeuralConfiguration& config);
    std::future<std::vector<double>> runInference(const std::string& agentId,
                                                  std::vector<double> inputs,
                                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    std::future<LearningSession> trainAgent(const std::string& agentId,
                                            std::vector<TrainingSample> data,
                                            std::optional<size_t> epochs = std::nullopt);
    std::future<void> shareKnowledge(const std::string& sourceId, const std::vector<std::string>& targetIds);
    // Неизвестный id: no-op. Агент в обучении удаляется по окончании сессии.
    std::future<void> terminateAgent(const std::string& agentId);

    std::optional<NeuralAgent> getAgentState(const std::string& agentId) const;
    std::vector<NeuralAgent> getActiveAgents() const; // Только агенты в состоянии Active
    metrics::PerformanceSnapshot getPerformanceMetrics() const;
    metrics::NetworkTopology getNetworkTopology() const;

    // Удаляет всех агентов, останавливает отчёт, рассылает cleanup и снимает подписчиков.
    // Повторный вызов: no-op.
    std::future<void> cleanup();

    events::SubscriptionId subscribe(events::EventCallback callback);
    bool unsubscribe(events::SubscriptionId id);

    const NeuralAgentManagerConfig& getConfiguration() const { return config_; }
private:
    enum class Lifecycle { Created, Running, Stopping, Stopped };

    void ensureRunning() const;
    void ensureInitialized() const;
    void removeNow(const std::string& agentId); // Уничтожить сеть и удалить запись
    void onTrainingFinished(const std::string& agentId);
    void shutdown();

    const NeuralAgentManagerConfig config_;
    std::shared_ptr<kernel::IComputeKernel> kernel_;
    std::atomic<Lifecycle> lifecycle_{Lifecycle::Created};
    mutable std::shared_mutex lifecycleMutex_; // Новые операции против cleanup

    // Порядок объявления важен: пул останавливается раньше, чем разрушаются реестр и монитор
    std::unique_ptr<events::EventNotifier> events_;
    std::unique_ptr<memory::MemoryGovernor> memory_;
    std::unique_ptr<AgentRegistry> registry_;
    std::unique_ptr<metrics::PerformanceMonitor> monitor_;
    std::unique_ptr<thread::ThreadPool> pool_;
    std::unique_ptr<inference::InferenceScheduler> scheduler_;
    std::unique_ptr<training::TrainingCoordinator> coordinator_;
    std::unique_ptr<transfer::KnowledgeTransfer> transfer_;
};

} // namespace agent
} // namespace core
} // namespace synapse
