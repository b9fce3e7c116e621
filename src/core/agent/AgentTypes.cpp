#include "core/agent/AgentTypes.hpp"
#include "core/agent/AgentErrors.hpp"
#include <algorithm>
#include <array>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace agent {

namespace {

constexpr std::array<const char*, 5> kNetworkTypes = {"mlp", "lstm", "cnn", "transformer", "custom"};
constexpr std::array<const char*, 5> kActivations = {"relu", "sigmoid", "tanh", "leaky_relu", "gelu"};
constexpr std::array<const char*, 3> kRegularizations = {"l1", "l2", "dropout"};
constexpr const char* kDefaultActivation = "relu";

template <size_t N>
bool isKnown(const std::array<const char*, N>& known, const std::string& value) {
    return std::any_of(known.begin(), known.end(), [&value](const char* k) { return value == k; });
}

int64_t toMillis(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

const char* toString(AgentState state) {
    switch (state) {
        case AgentState::Initializing: return "initializing";
        case AgentState::Active: return "active";
        case AgentState::Learning: return "learning";
        case AgentState::Terminating: return "terminating";
        case AgentState::Error: return "error";
    }
    return "unknown";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::Capacity: return "CapacityError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::StateConflict: return "StateConflictError";
        case ErrorKind::Timeout: return "TimeoutError";
        case ErrorKind::FeatureDisabled: return "FeatureDisabledError";
        case ErrorKind::Kernel: return "KernelError";
        case ErrorKind::NotInitialized: return "NotInitializedError";
    }
    return "UnknownError";
}

nlohmann::json NeuralConfiguration::toJson() const {
    nlohmann::json j = {
        {"type", type},
        {"architecture", architecture},
        {"activationFunction", activationFunction},
        {"batchSize", batchSize},
        {"epochs", epochs},
        {"simdOptimized", simdOptimized}
    };
    if (learningRate) j["learningRate"] = *learningRate;
    if (momentum) j["momentum"] = *momentum;
    if (regularization) {
        j["regularization"] = {{"type", regularization->type}, {"value", regularization->value}};
    }
    return j;
}

NeuralConfiguration NeuralConfiguration::fromJson(const nlohmann::json& j) {
    NeuralConfiguration config;
    try {
        config.type = j.value("type", config.type);
        if (j.contains("architecture")) {
            config.architecture = j.at("architecture").get<std::vector<size_t>>();
        }
        config.activationFunction = j.value("activationFunction", config.activationFunction);
        if (j.contains("learningRate")) config.learningRate = j.at("learningRate").get<double>();
        if (j.contains("momentum")) config.momentum = j.at("momentum").get<double>();
        if (j.contains("regularization")) {
            const auto& r = j.at("regularization");
            config.regularization = Regularization{r.value("type", std::string("l2")), r.value("value", 0.0)};
        }
        config.batchSize = j.value("batchSize", config.batchSize);
        config.epochs = j.value("epochs", config.epochs);
        config.simdOptimized = j.value("simdOptimized", config.simdOptimized);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid neural configuration JSON: ") + e.what());
    }
    return config;
}

NeuralConfiguration normalizeConfiguration(const NeuralConfiguration& config) {
    if (config.type.empty()) {
        throw ConfigurationError("Network type must not be empty");
    }
    if (!isKnown(kNetworkTypes, config.type)) {
        throw ConfigurationError("Unknown network type: " + config.type);
    }
    if (config.architecture.empty()) {
        throw ConfigurationError("Architecture must contain at least one layer");
    }
    for (size_t i = 0; i < config.architecture.size(); ++i) {
        if (config.architecture[i] == 0) {
            throw ConfigurationError("Layer " + std::to_string(i) + " has zero width");
        }
    }
    if (config.learningRate && !(*config.learningRate > 0.0 && *config.learningRate <= 1.0)) {
        throw ConfigurationError("Learning rate must lie in (0, 1]");
    }
    if (config.momentum && !(*config.momentum >= 0.0 && *config.momentum < 1.0)) {
        throw ConfigurationError("Momentum must lie in [0, 1)");
    }
    if (config.regularization) {
        if (!isKnown(kRegularizations, config.regularization->type)) {
            throw ConfigurationError("Unknown regularization type: " + config.regularization->type);
        }
        if (config.regularization->value < 0.0) {
            throw ConfigurationError("Regularization value must be non-negative");
        }
    }
    if (config.batchSize == 0) {
        throw ConfigurationError("Batch size must be positive");
    }
    if (config.epochs == 0) {
        throw ConfigurationError("Default epoch count must be positive");
    }

    NeuralConfiguration normalized = config;
    if (!isKnown(kActivations, normalized.activationFunction)) {
        if (!normalized.activationFunction.empty()) {
            spdlog::warn("[Config] неизвестная функция активации '{}', используется {}",
                         normalized.activationFunction, kDefaultActivation);
        }
        normalized.activationFunction = kDefaultActivation;
    }
    return normalized;
}

nlohmann::json NeuralAgent::toJson() const {
    return {
        {"id", id},
        {"config", config.toJson()},
        {"state", toString(state)},
        {"createdAt", toMillis(createdAt)},
        {"lastActive", toMillis(lastActive)},
        {"memoryUsage", memoryUsage},
        {"totalInferences", totalInferences},
        {"averageInferenceTime", averageInferenceTime},
        {"learningProgress", learningProgress},
        {"connectionStrength", connectionStrength}
    };
}

nlohmann::json LearningSession::toJson() const {
    return {
        {"sessionId", sessionId},
        {"agentId", agentId},
        {"startTime", startTime},
        {"duration", duration},
        {"epochs", epochs},
        {"dataPoints", dataPoints},
        {"finalAccuracy", finalAccuracy},
        {"finalError", finalError},
        {"convergenceEpoch", convergenceEpoch},
        {"converged", converged}
    };
}

} // namespace agent
} // namespace core
} // namespace synapse
