#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace synapse {
namespace core {
namespace agent {

// Жизненный цикл агента: Initializing -> Active <-> Learning -> Terminating (удаление).
// Error достижим из Active/Learning при невосстановимой ошибке ядра.
enum class AgentState {
    Initializing,
    Active,
    Learning,
    Terminating,
    Error
};

const char* toString(AgentState state);

// Регуляризация (опционально)
struct Regularization {
    std::string type = "l2"; // l1 | l2 | dropout
    double value = 0.0;
};

// NeuralConfiguration: параметры сети агента, неизменны после spawn
struct NeuralConfiguration {
    std::string type = "mlp";                 // mlp | lstm | cnn | transformer | custom
    std::vector<size_t> architecture;         // Ширины слоёв [input, hidden..., output]
    std::string activationFunction = "relu";  // relu | sigmoid | tanh | leaky_relu | gelu
    std::optional<double> learningRate;       // (0, 1]
    std::optional<double> momentum;           // [0, 1)
    std::optional<Regularization> regularization;
    size_t batchSize = 32;
    size_t epochs = 100;                      // Эпох по умолчанию для trainAgent
    bool simdOptimized = false;

    nlohmann::json toJson() const;
    static NeuralConfiguration fromJson(const nlohmann::json& j);
};

// Проверка и нормализация конфигурации.
// Бросает ConfigurationError; неизвестная функция активации заменяется на relu.
NeuralConfiguration normalizeConfiguration(const NeuralConfiguration& config);

// Обучающий пример
struct TrainingSample {
    std::vector<double> inputs;
    std::vector<double> outputs;
};

// NeuralAgent: запись реестра
struct NeuralAgent {
    std::string id;
    NeuralConfiguration config;
    AgentState state = AgentState::Initializing;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point lastActive;
    size_t memoryUsage = 0;            // Байт, зарезервировано MemoryGovernor
    uint64_t totalInferences = 0;
    double averageInferenceTime = 0.0; // мс
    double learningProgress = 0.0;     // 0..1
    double connectionStrength = 1.0;

    nlohmann::json toJson() const;
};

// LearningSession: итог одного вызова trainAgent, после создания не меняется
struct LearningSession {
    std::string sessionId;
    std::string agentId;
    int64_t startTime = 0;    // Unix time, мс
    double duration = 0.0;    // мс
    size_t epochs = 0;
    size_t dataPoints = 0;
    double finalAccuracy = 0.0;
    double finalError = 0.0;
    size_t convergenceEpoch = 0;
    bool converged = false;

    nlohmann::json toJson() const;
};

} // namespace agent
} // namespace core
} // namespace synapse
