#include "core/metrics/PerformanceMonitor.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace metrics {

namespace {

constexpr double kSpawnBudgetMs = 100.0;
constexpr double kMaxSpawnPenalty = 20.0;
constexpr double kMaxInferencePenalty = 20.0;
constexpr double kMaxFailurePenalty = 40.0;
constexpr double kPressureThreshold = 0.8;
constexpr double kPressureFactor = 50.0;

} // namespace

nlohmann::json PerformanceSnapshot::toJson() const {
    return {
        {"totalAgentsSpawned", totalAgentsSpawned},
        {"averageSpawnTime", averageSpawnTime},
        {"averageInferenceTime", averageInferenceTime},
        {"memoryUsage", memoryUsage},
        {"activeLearningTasks", activeLearningTasks},
        {"systemHealthScore", systemHealthScore},
        {"activeAgents", activeAgents},
        {"totalInferences", totalInferences},
        {"totalTimeouts", totalTimeouts},
        {"totalErrors", totalErrors},
        {"kernelMemoryUsage", kernelMemoryUsage}
    };
}

nlohmann::json NetworkTopology::toJson() const {
    nlohmann::json jNodes = nlohmann::json::array();
    for (const auto& node : nodes) {
        jNodes.push_back({
            {"id", node.id},
            {"type", node.type},
            {"state", agent::toString(node.state)},
            {"performance", node.performance},
            {"memoryUsage", node.memoryUsage}
        });
    }
    nlohmann::json jConnections = nlohmann::json::array();
    for (const auto& c : connections) {
        jConnections.push_back(nlohmann::json::array({c.from, c.to, c.strength}));
    }
    return {
        {"nodes", jNodes},
        {"connections", jConnections},
        {"activeConnections", activeConnections},
        {"totalNodes", totalNodes},
        {"networkHealth", networkHealth}
    };
}

PerformanceMonitor::PerformanceMonitor(const agent::AgentRegistry& registry,
                                       const memory::MemoryGovernor& memory,
                                       const kernel::IComputeKernel& kernel,
                                       std::chrono::milliseconds inferenceTimeout)
    : registry_(registry), memory_(memory), kernel_(kernel), inferenceTimeout_(inferenceTimeout) {}

PerformanceMonitor::~PerformanceMonitor() {
    stop();
}

void PerformanceMonitor::pushOutcome(bool failed) {
    outcomes_.push_back(failed);
    if (outcomes_.size() > kOutcomeWindow) outcomes_.pop_front();
}

void PerformanceMonitor::recordSpawn(double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++spawnCount_;
    averageSpawnTime_ += (ms - averageSpawnTime_) / static_cast<double>(spawnCount_);
    pushOutcome(false);
}

void PerformanceMonitor::recordInference(double ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++inferenceCount_;
    averageInferenceTime_ += (ms - averageInferenceTime_) / static_cast<double>(inferenceCount_);
    pushOutcome(false);
}

void PerformanceMonitor::recordTimeout() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++timeouts_;
    pushOutcome(true);
}

void PerformanceMonitor::recordError() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++errors_;
    pushOutcome(true);
}

void PerformanceMonitor::learningStarted() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++activeLearning_;
}

void PerformanceMonitor::learningFinished(bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (activeLearning_ > 0) --activeLearning_;
    if (success) pushOutcome(false);
}

size_t PerformanceMonitor::activeLearningTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeLearning_;
}

double PerformanceMonitor::computeHealth(const HealthInputs& in) {
    double score = 100.0;
    if (in.averageSpawnTime > kSpawnBudgetMs) {
        score -= std::min(kMaxSpawnPenalty, (in.averageSpawnTime - kSpawnBudgetMs) / kSpawnBudgetMs * kMaxSpawnPenalty);
    }
    if (in.inferenceTimeout > 0.0 && in.averageInferenceTime > in.inferenceTimeout) {
        score -= std::min(kMaxInferencePenalty,
                          (in.averageInferenceTime - in.inferenceTimeout) / in.inferenceTimeout * kMaxInferencePenalty);
    }
    score -= kMaxFailurePenalty * std::clamp(in.failureRate, 0.0, 1.0);
    if (in.memoryPressure > kPressureThreshold) {
        score -= (std::min(in.memoryPressure, 1.0) - kPressureThreshold) * kPressureFactor;
    }
    if (in.capacityPressure > kPressureThreshold) {
        score -= (std::min(in.capacityPressure, 1.0) - kPressureThreshold) * kPressureFactor;
    }
    return std::round(std::clamp(score, 0.0, 100.0));
}

HealthInputs PerformanceMonitor::healthInputs() const {
    HealthInputs in;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in.averageSpawnTime = averageSpawnTime_;
        in.averageInferenceTime = averageInferenceTime_;
        if (!outcomes_.empty()) {
            const auto failures = std::count(outcomes_.begin(), outcomes_.end(), true);
            in.failureRate = static_cast<double>(failures) / static_cast<double>(outcomes_.size());
        }
    }
    in.inferenceTimeout = static_cast<double>(inferenceTimeout_.count());
    in.memoryPressure = memory_.pressure();
    const size_t maxAgents = registry_.maxAgents();
    in.capacityPressure = maxAgents == 0 ? 1.0
        : static_cast<double>(registry_.size()) / static_cast<double>(maxAgents);
    return in;
}

PerformanceSnapshot PerformanceMonitor::snapshot() const {
    PerformanceSnapshot s;
    const HealthInputs in = healthInputs();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.averageSpawnTime = averageSpawnTime_;
        s.averageInferenceTime = averageInferenceTime_;
        s.activeLearningTasks = activeLearning_;
        s.totalInferences = inferenceCount_;
        s.totalTimeouts = timeouts_;
        s.totalErrors = errors_;
    }
    s.totalAgentsSpawned = registry_.totalSpawned();
    s.activeAgents = registry_.activeAgents();
    s.memoryUsage = memory_.totalReserved();
    s.kernelMemoryUsage = kernel_.currentMemoryUsage();
    s.systemHealthScore = computeHealth(in);
    return s;
}

NetworkTopology PerformanceMonitor::topology() const {
    NetworkTopology topo;
    const auto agents = registry_.list();
    size_t active = 0;
    for (const auto& a : agents) {
        topo.nodes.push_back({a.id, a.config.type, a.state, a.averageInferenceTime, a.memoryUsage});
        if (a.state == agent::AgentState::Active) ++active;
    }
    for (size_t i = 0; i < agents.size(); ++i) {
        for (size_t j = i + 1; j < agents.size(); ++j) {
            topo.connections.push_back({agents[i].id, agents[j].id,
                                        std::min(agents[i].connectionStrength, agents[j].connectionStrength)});
            if (agents[i].state == agent::AgentState::Active && agents[j].state == agent::AgentState::Active) {
                ++topo.activeConnections;
            }
        }
    }
    topo.totalNodes = agents.size();
    const double health = computeHealth(healthInputs());
    topo.networkHealth = agents.empty() ? health
        : std::round(health * static_cast<double>(active) / static_cast<double>(agents.size()));
    return topo;
}

bool PerformanceMonitor::start(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        spdlog::error("[Monitor] некорректный интервал отчёта: {} мс", interval.count());
        return false;
    }
    if (reporting_.exchange(true)) return true;
    reporter_ = std::thread(&PerformanceMonitor::reportLoop, this, interval);
    spdlog::info("[Monitor] фоновый отчёт запущен, интервал {} мс", interval.count());
    return true;
}

void PerformanceMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(reporterMutex_);
        if (!reporting_.exchange(false)) return;
    }
    reporterCv_.notify_all();
    if (reporter_.joinable()) reporter_.join();
    spdlog::info("[Monitor] фоновый отчёт остановлен");
}

void PerformanceMonitor::reportLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(reporterMutex_);
    while (reporting_.load()) {
        if (reporterCv_.wait_for(lock, interval, [this]() { return !reporting_.load(); })) break;
        lock.unlock();
        try {
            const PerformanceSnapshot s = snapshot();
            spdlog::info("[Monitor] {}", s.toJson().dump());
            if (s.kernelMemoryUsage > s.memoryUsage) {
                spdlog::warn("[Monitor] ядро сообщает {} байт, учтено {} байт", s.kernelMemoryUsage, s.memoryUsage);
            }
        } catch (const std::exception& e) {
            spdlog::error("[Monitor] ошибка формирования отчёта: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace metrics
} // namespace core
} // namespace synapse
