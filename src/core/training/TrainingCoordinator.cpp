#include "core/training/TrainingCoordinator.hpp"
#include "core/agent/AgentErrors.hpp"
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace training {

using agent::AgentState;

namespace {

// Счётчик активных сессий уменьшается при любом исходе
class LearningTaskGuard {
public:
    explicit LearningTaskGuard(metrics::PerformanceMonitor& monitor) : monitor_(monitor) {}
    ~LearningTaskGuard() { monitor_.learningFinished(success_); }
    LearningTaskGuard(const LearningTaskGuard&) = delete;
    LearningTaskGuard& operator=(const LearningTaskGuard&) = delete;
    void succeed() { success_ = true; }
private:
    metrics::PerformanceMonitor& monitor_;
    bool success_ = false;
};

int64_t unixMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

TrainingCoordinator::TrainingCoordinator(agent::AgentRegistry& registry,
                                         kernel::IComputeKernel& kernel,
                                         metrics::PerformanceMonitor& monitor,
                                         events::EventNotifier& events,
                                         thread::ThreadPool& pool,
                                         TerminationHandler onDeferredTermination)
    : registry_(registry), kernel_(kernel), monitor_(monitor), events_(events), pool_(pool),
      onDeferredTermination_(std::move(onDeferredTermination)) {}

std::future<agent::LearningSession> TrainingCoordinator::train(const std::string& agentId,
                                                               std::vector<agent::TrainingSample> data,
                                                               std::optional<size_t> epochs) {
    auto slot = registry_.acquire(agentId);
    const auto snapshot = registry_.get(agentId);
    if (!snapshot) throw agent::NotFoundError(agentId);

    if (data.empty()) {
        throw agent::ConfigurationError("Training data must not be empty");
    }
    const auto& arch = snapshot->config.architecture;
    for (size_t i = 0; i < data.size(); ++i) {
        if (data[i].inputs.size() != arch.front() || data[i].outputs.size() != arch.back()) {
            throw agent::ConfigurationError("Training sample " + std::to_string(i) +
                                            " does not match architecture of " + agentId);
        }
    }
    const size_t epochCount = epochs.value_or(snapshot->config.epochs);

    registry_.transition(agentId, {AgentState::Active}, AgentState::Learning);
    monitor_.learningStarted();
    spdlog::info("[Training] {}: старт, {} эпох, {} примеров", agentId, epochCount, data.size());

    try {
        return pool_.submit([this, slot, agentId, data = std::move(data), epochCount]() {
            try {
                auto session = run(slot, agentId, data, epochCount);
                finishDeferredTermination(agentId);
                return session;
            } catch (const std::exception&) {
                finishDeferredTermination(agentId);
                throw;
            }
        });
    } catch (const std::exception& e) {
        spdlog::error("[Training] {}: не удалось поставить задачу: {}", agentId, e.what());
        monitor_.learningFinished(false);
        registry_.transition(agentId, {AgentState::Learning}, AgentState::Active);
        throw;
    }
}

agent::LearningSession TrainingCoordinator::run(const std::shared_ptr<agent::AgentSlot>& slot,
                                                const std::string& agentId,
                                                const std::vector<agent::TrainingSample>& data,
                                                size_t epochs) {
    LearningTaskGuard guard(monitor_);
    auto gate = slot->lockExclusive();

    agent::LearningSession session;
    session.agentId = agentId;
    session.startTime = unixMillis();
    session.sessionId = "learning_" + std::to_string(session.startTime) + "_" + agentId;
    session.epochs = epochs;
    session.dataPoints = data.size();
    const auto start = std::chrono::steady_clock::now();

    kernel::TrainingResult result;
    try {
        result = kernel_.trainNetwork(slot->network, data, epochs).get();
    } catch (const agent::KernelError& e) {
        handleFailure(agentId, e);
        throw;
    } catch (const std::exception& e) {
        agent::KernelError wrapped(std::string("Kernel training failed: ") + e.what());
        handleFailure(agentId, wrapped);
        throw wrapped;
    }

    session.duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    session.finalAccuracy = result.accuracy;
    session.finalError = result.loss;
    session.convergenceEpoch = result.convergenceEpoch;
    session.converged = result.converged;

    registry_.completeLearning(agentId, result.accuracy);
    guard.succeed();
    spdlog::info("[Training] {}: завершено за {:.1f} мс, точность {:.4f}", agentId, session.duration,
                 session.finalAccuracy);
    events_.notify(events::EventType::LearningComplete, session.toJson());
    return session;
}

void TrainingCoordinator::finishDeferredTermination(const std::string& agentId) {
    if (onDeferredTermination_) onDeferredTermination_(agentId);
}

void TrainingCoordinator::handleFailure(const std::string& agentId, const agent::KernelError& error) {
    monitor_.recordError();
    spdlog::error("[Training] {}: ошибка ядра: {}", agentId, error.what());
    if (error.recoverable()) {
        try {
            registry_.transition(agentId, {AgentState::Learning}, AgentState::Active);
        } catch (const agent::NeuralAgentError& e) {
            spdlog::warn("[Training] {}: не удалось вернуть в active: {}", agentId, e.what());
        }
    } else {
        registry_.markError(agentId);
    }
    events_.notify(events::EventType::Error, {
        {"agentId", agentId},
        {"operation", "training"},
        {"error", error.what()},
        {"recoverable", error.recoverable()}
    });
}

} // namespace training
} // namespace core
} // namespace synapse
