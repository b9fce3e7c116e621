#include "core/agent/ManagerConfig.hpp"
#include "core/agent/AgentErrors.hpp"
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace agent {

bool NeuralAgentManagerConfig::validate() const {
    if (maxAgents == 0) return false;
    if (memoryLimitPerAgent == 0) return false;
    if (aggregateMemoryLimit != 0 && aggregateMemoryLimit < memoryLimitPerAgent) return false;
    if (inferenceTimeout.count() <= 0) return false;
    if (performanceMonitoring && monitoringInterval.count() <= 0) return false;
    if (knowledgeInfluence < 0.0 || knowledgeInfluence > 1.0) return false;
    if (minWorkerThreads == 0 || minWorkerThreads > maxWorkerThreads) return false;
    return logging.validate();
}

size_t NeuralAgentManagerConfig::effectiveAggregateLimit() const {
    if (aggregateMemoryLimit != 0) return aggregateMemoryLimit;
    if (memoryLimitPerAgent != 0 && maxAgents > std::numeric_limits<size_t>::max() / memoryLimitPerAgent) {
        return std::numeric_limits<size_t>::max();
    }
    return maxAgents * memoryLimitPerAgent;
}

nlohmann::json NeuralAgentManagerConfig::toJson() const {
    return {
        {"maxAgents", maxAgents},
        {"memoryLimitPerAgent", memoryLimitPerAgent},
        {"aggregateMemoryLimit", aggregateMemoryLimit},
        {"inferenceTimeoutMs", inferenceTimeout.count()},
        {"crossLearningEnabled", crossLearningEnabled},
        {"performanceMonitoring", performanceMonitoring},
        {"monitoringIntervalMs", monitoringInterval.count()},
        {"knowledgeInfluence", knowledgeInfluence},
        {"minWorkerThreads", minWorkerThreads},
        {"maxWorkerThreads", maxWorkerThreads},
        {"logging", logging.toJson()}
    };
}

NeuralAgentManagerConfig NeuralAgentManagerConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Manager configuration must be a JSON object");
    }
    NeuralAgentManagerConfig config;
    try {
        config.maxAgents = j.value("maxAgents", config.maxAgents);
        config.memoryLimitPerAgent = j.value("memoryLimitPerAgent", config.memoryLimitPerAgent);
        config.aggregateMemoryLimit = j.value("aggregateMemoryLimit", config.aggregateMemoryLimit);
        config.inferenceTimeout = std::chrono::milliseconds(
            j.value("inferenceTimeoutMs", static_cast<int64_t>(config.inferenceTimeout.count())));
        config.crossLearningEnabled = j.value("crossLearningEnabled", config.crossLearningEnabled);
        config.performanceMonitoring = j.value("performanceMonitoring", config.performanceMonitoring);
        config.monitoringInterval = std::chrono::milliseconds(
            j.value("monitoringIntervalMs", static_cast<int64_t>(config.monitoringInterval.count())));
        config.knowledgeInfluence = j.value("knowledgeInfluence", config.knowledgeInfluence);
        config.minWorkerThreads = j.value("minWorkerThreads", config.minWorkerThreads);
        config.maxWorkerThreads = j.value("maxWorkerThreads", config.maxWorkerThreads);
        if (j.contains("logging")) {
            config.logging = logging::LoggingConfig::fromJson(j.at("logging"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid manager configuration JSON: ") + e.what());
    }
    if (!config.validate()) {
        throw ConfigurationError("Manager configuration failed validation");
    }
    return config;
}

NeuralAgentManagerConfig NeuralAgentManagerConfig::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Cannot open configuration file: " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Cannot parse configuration file " + path + ": " + e.what());
    }
    spdlog::info("[Config] конфигурация загружена из {}", path);
    return fromJson(j);
}

} // namespace agent
} // namespace core
} // namespace synapse
