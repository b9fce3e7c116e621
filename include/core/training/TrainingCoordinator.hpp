#pragma once
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/agent/AgentErrors.hpp"
#include "core/agent/AgentRegistry.hpp"
#include "core/events/EventNotifier.hpp"
#include "core/kernel/ComputeKernel.hpp"
#include "core/metrics/PerformanceMonitor.hpp"
#include "core/thread/ThreadPool.hpp"

namespace synapse {
namespace core {
namespace training {

// TrainingCoordinator: один вызов обучения как единый эпизод жизненного цикла,
// Active -> Learning -> Active (или Error при невосстановимой ошибке ядра)
class TrainingCoordinator {
public:
    // Вызывается в потоке обучения после его завершения: удаление, запрошенное во время сессии
    using TerminationHandler = std::function<void(const std::string&)>;

    TrainingCoordinator(agent::AgentRegistry& registry,
                        kernel::IComputeKernel& kernel,
                        metrics::PerformanceMonitor& monitor,
                        events::EventNotifier& events,
                        thread::ThreadPool& pool,
                        TerminationHandler onDeferredTermination = {});

    // Проверки и переход в Learning выполняются синхронно.
    // epochs по умолчанию берётся из конфигурации агента; 0: только оценка.
    std::future<agent::LearningSession> train(const std::string& agentId,
                                              std::vector<agent::TrainingSample> data,
                                              std::optional<size_t> epochs = std::nullopt);
private:
    agent::LearningSession run(const std::shared_ptr<agent::AgentSlot>& slot,
                               const std::string& agentId,
                               const std::vector<agent::TrainingSample>& data,
                               size_t epochs);
    void handleFailure(const std::string& agentId, const agent::KernelError& error);
    void finishDeferredTermination(const std::string& agentId);

    agent::AgentRegistry& registry_;
    kernel::IComputeKernel& kernel_;
    metrics::PerformanceMonitor& monitor_;
    events::EventNotifier& events_;
    thread::ThreadPool& pool_;
    TerminationHandler onDeferredTermination_;
};

} // namespace training
} // namespace core
} // namespace synapse
