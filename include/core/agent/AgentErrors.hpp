#pragma once
#include <stdexcept>
#include <string>

namespace synapse {
namespace core {
namespace agent {

// Категории ошибок менеджера агентов
enum class ErrorKind {
    Configuration,   // Некорректная NeuralConfiguration / конфиг менеджера
    Capacity,        // Пул агентов или память исчерпаны
    NotFound,        // Неизвестный id агента
    StateConflict,   // Операция несовместима с текущим состоянием
    Timeout,         // Инференс не уложился в дедлайн
    FeatureDisabled, // Функция отключена конфигурацией
    Kernel,          // Ошибка вычислительного ядра
    NotInitialized   // Менеджер не инициализирован или уже очищен
};

const char* toString(ErrorKind kind);

// NeuralAgentError: базовое исключение, все публичные операции бросают только его наследников
class NeuralAgentError : public std::runtime_error {
public:
    NeuralAgentError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }
private:
    ErrorKind kind_;
};

class ConfigurationError : public NeuralAgentError {
public:
    explicit ConfigurationError(const std::string& message)
        : NeuralAgentError(ErrorKind::Configuration, message) {}
};

class CapacityError : public NeuralAgentError {
public:
    explicit CapacityError(const std::string& message)
        : NeuralAgentError(ErrorKind::Capacity, message) {}
};

class NotFoundError : public NeuralAgentError {
public:
    explicit NotFoundError(const std::string& agentId)
        : NeuralAgentError(ErrorKind::NotFound, "Agent not found: " + agentId), agentId_(agentId) {}
    const std::string& agentId() const noexcept { return agentId_; }
private:
    std::string agentId_;
};

class StateConflictError : public NeuralAgentError {
public:
    explicit StateConflictError(const std::string& message)
        : NeuralAgentError(ErrorKind::StateConflict, message) {}
};

class TimeoutError : public NeuralAgentError {
public:
    explicit TimeoutError(const std::string& message)
        : NeuralAgentError(ErrorKind::Timeout, message) {}
};

class FeatureDisabledError : public NeuralAgentError {
public:
    explicit FeatureDisabledError(const std::string& message)
        : NeuralAgentError(ErrorKind::FeatureDisabled, message) {}
};

// KernelError: ошибка ядра передаётся вызывающему без изменений.
// recoverable == false означает, что сеть агента повреждена (агент переводится в Error).
class KernelError : public NeuralAgentError {
public:
    explicit KernelError(const std::string& message, bool recoverable = true)
        : NeuralAgentError(ErrorKind::Kernel, message), recoverable_(recoverable) {}
    bool recoverable() const noexcept { return recoverable_; }
private:
    bool recoverable_;
};

class NotInitializedError : public NeuralAgentError {
public:
    explicit NotInitializedError(const std::string& message)
        : NeuralAgentError(ErrorKind::NotInitialized, message) {}
};

} // namespace agent
} // namespace core
} // namespace synapse
