#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include "core/kernel/ComputeKernel.hpp"
#include "core/thread/ThreadPool.hpp"

namespace synapse {
namespace core {
namespace kernel {

// Параметры CPU-ядра
struct CpuKernelConfig {
    size_t minThreads = 1;                // Мин. потоки вычислений
    size_t maxThreads = 4;                // Макс. потоки вычислений
    uint32_t seed = 42;                   // Базовый seed инициализации весов
    double defaultLearningRate = 0.05;    // Если в конфигурации сети не задан
    double defaultMomentum = 0.9;         // Если в конфигурации сети не задан
    double convergenceThreshold = 1e-3;   // Ошибка, ниже которой сеть считается сошедшейся

    bool validate() const {
        if (minThreads == 0 || minThreads > maxThreads) return false;
        if (defaultLearningRate <= 0.0 || defaultLearningRate > 1.0) return false;
        if (defaultMomentum < 0.0 || defaultMomentum >= 1.0) return false;
        return convergenceThreshold > 0.0;
    }
};

// CpuComputeKernel. Эталонное ядро, полносвязная сеть прямого распространения.
// Поддерживает типы mlp и custom; скрытые слои с заданной активацией, выход: sigmoid.
// Обучение: mini-batch SGD с моментом, L1/L2/dropout регуляризация.
// Вычисления выполняются на собственном пуле потоков.
class CpuComputeKernel : public IComputeKernel {
public:
    explicit CpuComputeKernel(const CpuKernelConfig& config = CpuKernelConfig{});
    ~CpuComputeKernel() override;
    CpuComputeKernel(const CpuComputeKernel&) = delete;
    CpuComputeKernel& operator=(const CpuComputeKernel&) = delete;

    std::future<NetworkHandle> createNetwork(const agent::NeuralConfiguration& config) override;
    std::future<std::vector<double>> runInference(NetworkHandle handle,
                                                  const std::vector<double>& inputs,
                                                  CancellationToken token) override;
    std::future<TrainingResult> trainNetwork(NetworkHandle handle,
                                             const std::vector<agent::TrainingSample>& data,
                                             size_t epochs) override;
    std::future<std::vector<uint8_t>> serializeWeights(NetworkHandle handle) override;
    std::future<void> deserializeWeights(NetworkHandle handle,
                                         const std::vector<uint8_t>& weights,
                                         double influence) override;
    void destroyNetwork(NetworkHandle handle) override;
    size_t currentMemoryUsage() const override;
    std::string getName() const override;

    size_t networkCount() const; // Кол-во живых сетей

    struct Network;
private:
    std::shared_ptr<Network> findNetwork(NetworkHandle handle) const;

    CpuKernelConfig config_;
    std::unique_ptr<thread::ThreadPool> pool_; // Потоки вычислений
    mutable std::mutex networksMutex_;
    std::unordered_map<NetworkHandle, std::shared_ptr<Network>> networks_;
    std::atomic<NetworkHandle> nextHandle_{1};
    std::atomic<size_t> memoryUsage_{0};
};

} // namespace kernel
} // namespace core
} // namespace synapse
