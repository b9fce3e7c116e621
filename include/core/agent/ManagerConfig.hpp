#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "core/logging/Logging.hpp"

namespace synapse {
namespace core {
namespace agent {

// Конфигурация менеджера агентов
struct NeuralAgentManagerConfig {
    size_t maxAgents = 25;                         // Макс. агентов одновременно
    size_t memoryLimitPerAgent = 50 * 1024 * 1024; // Байт на агента
    size_t aggregateMemoryLimit = 0;               // 0 = maxAgents * memoryLimitPerAgent
    std::chrono::milliseconds inferenceTimeout{100};
    bool crossLearningEnabled = true;
    bool performanceMonitoring = true;
    std::chrono::milliseconds monitoringInterval{1000};
    double knowledgeInfluence = 0.1;               // Доля весов источника при передаче знаний
    size_t minWorkerThreads = 2;
    size_t maxWorkerThreads = 32;
    logging::LoggingConfig logging;

    bool validate() const;
    size_t effectiveAggregateLimit() const; // Насыщается до SIZE_MAX

    nlohmann::json toJson() const;
    static NeuralAgentManagerConfig fromJson(const nlohmann::json& j); // ConfigurationError
    static NeuralAgentManagerConfig loadFromFile(const std::string& path); // ConfigurationError
};

} // namespace agent
} // namespace core
} // namespace synapse
