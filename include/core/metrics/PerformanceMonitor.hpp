#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/agent/AgentRegistry.hpp"
#include "core/kernel/ComputeKernel.hpp"
#include "core/memory/MemoryGovernor.hpp"

namespace synapse {
namespace core {
namespace metrics {

// Снимок метрик менеджера, вычисляется по запросу
struct PerformanceSnapshot {
    uint64_t totalAgentsSpawned = 0;
    double averageSpawnTime = 0.0;     // мс
    double averageInferenceTime = 0.0; // мс
    size_t memoryUsage = 0;            // Байт, по учёту MemoryGovernor
    size_t activeLearningTasks = 0;
    double systemHealthScore = 100.0;  // 0..100
    size_t activeAgents = 0;
    uint64_t totalInferences = 0;
    uint64_t totalTimeouts = 0;
    uint64_t totalErrors = 0;
    size_t kernelMemoryUsage = 0;      // Байт, по данным ядра

    nlohmann::json toJson() const;
};

struct TopologyNode {
    std::string id;
    std::string type;
    agent::AgentState state = agent::AgentState::Active;
    double performance = 0.0; // Среднее время инференса агента, мс
    size_t memoryUsage = 0;
};

struct TopologyConnection {
    std::string from;
    std::string to;
    double strength = 1.0;
};

struct NetworkTopology {
    std::vector<TopologyNode> nodes;
    std::vector<TopologyConnection> connections;
    size_t activeConnections = 0;
    size_t totalNodes = 0;
    double networkHealth = 100.0;

    nlohmann::json toJson() const;
};

// Входные данные оценки здоровья
struct HealthInputs {
    double averageSpawnTime = 0.0;     // мс
    double averageInferenceTime = 0.0; // мс
    double inferenceTimeout = 100.0;   // мс
    double failureRate = 0.0;          // 0..1, по последним исходам
    double memoryPressure = 0.0;       // 0..1
    double capacityPressure = 0.0;     // 0..1
};

// PerformanceMonitor: сбор счётчиков и оценка здоровья, плюс фоновый отчёт в лог
class PerformanceMonitor {
public:
    static constexpr size_t kOutcomeWindow = 100;

    PerformanceMonitor(const agent::AgentRegistry& registry,
                       const memory::MemoryGovernor& memory,
                       const kernel::IComputeKernel& kernel,
                       std::chrono::milliseconds inferenceTimeout);
    ~PerformanceMonitor();
    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    void recordSpawn(double ms);
    void recordInference(double ms);
    void recordTimeout();
    void recordError();
    void learningStarted();
    void learningFinished(bool success);
    size_t activeLearningTasks() const;

    PerformanceSnapshot snapshot() const;
    NetworkTopology topology() const;

    // 100 минус штрафы, результат в [0, 100] с округлением
    static double computeHealth(const HealthInputs& inputs);

    // Фоновый отчёт: JSON-снимок в лог раз в interval
    bool start(std::chrono::milliseconds interval);
    void stop();
    bool isReporting() const { return reporting_.load(); }
private:
    void pushOutcome(bool failed);
    HealthInputs healthInputs() const;
    void reportLoop(std::chrono::milliseconds interval);

    const agent::AgentRegistry& registry_;
    const memory::MemoryGovernor& memory_;
    const kernel::IComputeKernel& kernel_;
    const std::chrono::milliseconds inferenceTimeout_;

    mutable std::mutex mutex_;
    uint64_t spawnCount_ = 0;
    double averageSpawnTime_ = 0.0;
    uint64_t inferenceCount_ = 0;
    double averageInferenceTime_ = 0.0;
    uint64_t timeouts_ = 0;
    uint64_t errors_ = 0;
    size_t activeLearning_ = 0;
    std::deque<bool> outcomes_; // true: отказ

    std::atomic<bool> reporting_{false};
    std::mutex reporterMutex_;
    std::condition_variable reporterCv_;
    std::thread reporter_;
};

} // namespace metrics
} // namespace core
} // namespace synapse
