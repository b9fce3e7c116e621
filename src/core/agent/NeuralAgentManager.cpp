#include "core/agent/NeuralAgentManager.hpp"
#include "core/agent/AgentErrors.hpp"
#include <mutex>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace agent {

NeuralAgentManager::NeuralAgentManager(const NeuralAgentManagerConfig& config,
                                       std::shared_ptr<kernel::IComputeKernel> kernel)
    : config_(config), kernel_(std::move(kernel)), events_(std::make_unique<events::EventNotifier>()) {}

NeuralAgentManager::~NeuralAgentManager() {
    Lifecycle expected = Lifecycle::Running;
    if (lifecycle_.compare_exchange_strong(expected, Lifecycle::Stopping)) {
        try {
            shutdown();
        } catch (const std::exception& e) {
            spdlog::error("[NAM] ошибка при остановке в деструкторе: {}", e.what());
        }
    }
    if (pool_) pool_->stop();
}

bool NeuralAgentManager::initialize() {
    std::unique_lock<std::shared_mutex> lock(lifecycleMutex_);
    const Lifecycle state = lifecycle_.load();
    if (state == Lifecycle::Running) return true;
    if (state != Lifecycle::Created) {
        spdlog::error("[NAM] повторная инициализация после cleanup не поддерживается");
        return false;
    }
    if (!kernel_) {
        spdlog::error("[NAM] вычислительное ядро не задано");
        return false;
    }
    if (!config_.validate()) {
        spdlog::error("[NAM] некорректная конфигурация: {}", config_.toJson().dump());
        return false;
    }
    try {
        memory_ = std::make_unique<memory::MemoryGovernor>(config_.memoryLimitPerAgent,
                                                           config_.effectiveAggregateLimit());
        registry_ = std::make_unique<AgentRegistry>(config_.maxAgents, *memory_, *events_);
        monitor_ = std::make_unique<metrics::PerformanceMonitor>(*registry_, *memory_, *kernel_,
                                                                 config_.inferenceTimeout);
        thread::ThreadPoolConfig poolConfig;
        poolConfig.minThreads = config_.minWorkerThreads;
        poolConfig.maxThreads = config_.maxWorkerThreads;
        poolConfig.name = "nam-worker";
        pool_ = std::make_unique<thread::ThreadPool>(poolConfig);
        scheduler_ = std::make_unique<inference::InferenceScheduler>(*registry_, *kernel_, *monitor_, *events_,
                                                                     *pool_, config_.inferenceTimeout);
        coordinator_ = std::make_unique<training::TrainingCoordinator>(
            *registry_, *kernel_, *monitor_, *events_, *pool_,
            [this](const std::string& agentId) { onTrainingFinished(agentId); });
        transfer_ = std::make_unique<transfer::KnowledgeTransfer>(*registry_, *kernel_, *monitor_, *events_, *pool_,
                                                                  config_.crossLearningEnabled,
                                                                  config_.knowledgeInfluence);
        if (config_.performanceMonitoring && !monitor_->start(config_.monitoringInterval)) {
            spdlog::error("[NAM] не удалось запустить мониторинг");
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("[NAM] ошибка инициализации: {}", e.what());
        return false;
    }
    lifecycle_ = Lifecycle::Running;
    spdlog::info("[NAM] менеджер инициализирован: до {} агентов, ядро {}", config_.maxAgents, kernel_->getName());
    events_->notify(events::EventType::Initialized, {
        {"config", config_.toJson()},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count()}
    });
    return true;
}

bool NeuralAgentManager::isInitialized() const {
    return lifecycle_.load() == Lifecycle::Running;
}

void NeuralAgentManager::ensureRunning() const {
    if (lifecycle_.load() != Lifecycle::Running) {
        throw NotInitializedError("NeuralAgentManager is not initialized");
    }
}

void NeuralAgentManager::ensureInitialized() const {
    if (!registry_) {
        throw NotInitializedError("NeuralAgentManager is not initialized");
    }
}

std::future<std::string> NeuralAgentManager::spawnAgent(const NeuralConfiguration& config) {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureRunning();
    const NeuralConfiguration normalized = normalizeConfiguration(config);
    const size_t footprint = memory::MemoryGovernor::estimateFootprint(normalized.architecture);

    registry_->reserveCapacity();
    if (!memory_->reserve(footprint)) {
        registry_->releaseCapacity();
        throw CapacityError("Memory limit exceeded: agent needs " + std::to_string(footprint) + " bytes");
    }
    const auto start = std::chrono::steady_clock::now();
    auto rollback = [this, footprint]() {
        memory_->release(footprint);
        registry_->releaseCapacity();
    };

    try {
        return pool_->submit([this, normalized, footprint, start, rollback]() -> std::string {
            kernel::NetworkHandle handle = kernel::kInvalidNetwork;
            try {
                handle = kernel_->createNetwork(normalized).get();
            } catch (const KernelError& e) {
                rollback();
                monitor_->recordError();
                spdlog::error("[NAM] ядро не создало сеть: {}", e.what());
                events_->notify(events::EventType::Error, {
                    {"operation", "spawn"}, {"error", e.what()}, {"recoverable", e.recoverable()}
                });
                throw;
            } catch (const std::exception& e) {
                rollback();
                monitor_->recordError();
                spdlog::error("[NAM] ядро не создало сеть: {}", e.what());
                events_->notify(events::EventType::Error, {
                    {"operation", "spawn"}, {"error", e.what()}, {"recoverable", true}
                });
                throw KernelError(std::string("Network creation failed: ") + e.what());
            }
            const double spawnMs = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start).count();
            monitor_->recordSpawn(spawnMs);
            return registry_->insert(normalized, handle, footprint, spawnMs);
        });
    } catch (const std::exception& e) {
        spdlog::error("[NAM] не удалось поставить spawn в очередь: {}", e.what());
        rollback();
        throw;
    }
}

std::future<std::vector<double>> NeuralAgentManager::runInference(const std::string& agentId,
                                                                  std::vector<double> inputs,
                                                                  std::optional<std::chrono::milliseconds> timeout) {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureRunning();
    return scheduler_->infer(agentId, std::move(inputs), timeout);
}

std::future<LearningSession> NeuralAgentManager::trainAgent(const std::string& agentId,
                                                            std::vector<TrainingSample> data,
                                                            std::optional<size_t> epochs) {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureRunning();
    return coordinator_->train(agentId, std::move(data), epochs);
}

std::future<void> NeuralAgentManager::shareKnowledge(const std::string& sourceId,
                                                     const std::vector<std::string>& targetIds) {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureRunning();
    return transfer_->share(sourceId, targetIds);
}

std::future<void> NeuralAgentManager::terminateAgent(const std::string& agentId) {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureRunning();
    // Переход в Terminating синхронный: обучение, начатое после этого вызова, отклоняется
    TerminationTicket ticket = registry_->requestTermination(agentId);
    switch (ticket.status) {
    case TerminationStatus::NotFound:
        spdlog::debug("[NAM] terminate {}: агент не найден, пропуск", agentId);
        break;
    case TerminationStatus::Started:
        try {
            pool_->enqueue([this, agentId]() { removeNow(agentId); });
        } catch (const std::exception& e) {
            spdlog::warn("[NAM] terminate {}: пул недоступен ({}), удаление в вызывающем потоке", agentId, e.what());
            removeNow(agentId);
        }
        break;
    case TerminationStatus::Deferred:
        spdlog::info("[NAM] terminate {}: агент обучается, удаление после сессии", agentId);
        break;
    case TerminationStatus::Pending:
        break;
    }
    return std::move(ticket.done);
}

void NeuralAgentManager::onTrainingFinished(const std::string& agentId) {
    if (registry_->claimDeferredTermination(agentId)) {
        removeNow(agentId);
    }
}

void NeuralAgentManager::removeNow(const std::string& agentId) {
    auto slot = registry_->find(agentId);
    if (!slot) return;
    auto gate = slot->lockExclusive();
    try {
        kernel_->destroyNetwork(slot->network);
    } catch (const std::exception& e) {
        // Запись удаляется в любом случае, иначе ожидающие terminate не завершатся
        spdlog::error("[NAM] terminate {}: ядро не освободило сеть: {}", agentId, e.what());
    }
    registry_->remove(agentId);
}

std::optional<NeuralAgent> NeuralAgentManager::getAgentState(const std::string& agentId) const {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureInitialized();
    return registry_->get(agentId);
}

std::vector<NeuralAgent> NeuralAgentManager::getActiveAgents() const {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureInitialized();
    return registry_->list(AgentState::Active);
}

metrics::PerformanceSnapshot NeuralAgentManager::getPerformanceMetrics() const {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureInitialized();
    return monitor_->snapshot();
}

metrics::NetworkTopology NeuralAgentManager::getNetworkTopology() const {
    std::shared_lock<std::shared_mutex> lock(lifecycleMutex_);
    ensureInitialized();
    return monitor_->topology();
}

std::future<void> NeuralAgentManager::cleanup() {
    {
        std::unique_lock<std::shared_mutex> lock(lifecycleMutex_);
        Lifecycle expected = Lifecycle::Running;
        if (!lifecycle_.compare_exchange_strong(expected, Lifecycle::Stopping)) {
            std::promise<void> done;
            done.set_value();
            return done.get_future();
        }
    }
    return std::async(std::launch::async, [this]() { shutdown(); });
}

void NeuralAgentManager::shutdown() {
    spdlog::info("[NAM] cleanup: {} агентов", registry_->size());
    // Дождаться уже поставленных операций
    pool_->waitForCompletion();
    // Очередь пуста: в полёте только поздние вызовы ядра, их дождётся lockExclusive
    for (const auto& id : registry_->ids()) {
        removeNow(id);
    }
    memory_->releaseAll();
    monitor_->stop();
    lifecycle_ = Lifecycle::Stopped;
    events_->notify(events::EventType::Cleanup, {
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count()}
    });
    events_->clear();
    spdlog::info("[NAM] cleanup завершён");
}

events::SubscriptionId NeuralAgentManager::subscribe(events::EventCallback callback) {
    return events_->subscribe(std::move(callback));
}

bool NeuralAgentManager::unsubscribe(events::SubscriptionId id) {
    return events_->unsubscribe(id);
}

} // namespace agent
} // namespace core
} // namespace synapse
