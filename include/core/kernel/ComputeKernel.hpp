#pragma once
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "core/agent/AgentTypes.hpp"

namespace synapse {
namespace core {
namespace kernel {

// Непрозрачный идентификатор сети внутри ядра
using NetworkHandle = uint64_t;
constexpr NetworkHandle kInvalidNetwork = 0;

// CancellationToken: кооперативная отмена вызова ядра.
// Копии разделяют один флаг: менеджер отменяет, ядро проверяет между шагами.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() noexcept { flag_->store(true); }
    bool isCancelled() const noexcept { return flag_->load(); }
private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Результат обучения сети
struct TrainingResult {
    double accuracy = 0.0;       // 0..1
    double loss = 0.0;           // Итоговая ошибка
    size_t convergenceEpoch = 0; // Эпоха сходимости (== epochs, если не сошлось)
    bool converged = false;
    double trainingTime = 0.0;   // мс
};

// IComputeKernel: контракт вычислительного ядра.
// Все операции асинхронны; ошибки приходят из future как agent::KernelError.
class IComputeKernel {
public:
    virtual ~IComputeKernel() = default;

    // Создание сети по нормализованной конфигурации
    virtual std::future<NetworkHandle> createNetwork(const agent::NeuralConfiguration& config) = 0;

    // Прямой проход. Собственного таймаута нет, дедлайн задаёт вызывающий через token.
    virtual std::future<std::vector<double>> runInference(NetworkHandle handle,
                                                          const std::vector<double>& inputs,
                                                          CancellationToken token) = 0;

    // Обучение на всём числе эпох
    virtual std::future<TrainingResult> trainNetwork(NetworkHandle handle,
                                                     const std::vector<agent::TrainingSample>& data,
                                                     size_t epochs) = 0;

    virtual std::future<std::vector<uint8_t>> serializeWeights(NetworkHandle handle) = 0;

    // influence: доля новых весов при смешивании (1.0 = полная замена)
    virtual std::future<void> deserializeWeights(NetworkHandle handle,
                                                 const std::vector<uint8_t>& weights,
                                                 double influence) = 0;

    // Освобождение сети; неизвестный handle игнорируется
    virtual void destroyNetwork(NetworkHandle handle) = 0;

    // Оценка занятой ядром памяти, байт (не авторитетна)
    virtual size_t currentMemoryUsage() const = 0;

    virtual std::string getName() const = 0;
};

} // namespace kernel
} // namespace core
} // namespace synapse
