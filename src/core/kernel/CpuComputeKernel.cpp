#include "core/kernel/CpuComputeKernel.hpp"
#include "core/agent/AgentErrors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <numeric>
#include <random>
#include <shared_mutex>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace kernel {

using agent::KernelError;

namespace {

constexpr uint32_t kWeightsMagic = 0x53594E57; // "SYNW"
constexpr uint32_t kWeightsVersion = 1;
constexpr double kLeakySlope = 0.01;
constexpr double kPi = 3.14159265358979323846;

enum class Activation { Relu, Sigmoid, Tanh, LeakyRelu, Gelu };

Activation parseActivation(const std::string& name) {
    if (name == "sigmoid") return Activation::Sigmoid;
    if (name == "tanh") return Activation::Tanh;
    if (name == "leaky_relu") return Activation::LeakyRelu;
    if (name == "gelu") return Activation::Gelu;
    return Activation::Relu;
}

double sigmoid(double z) {
    return 1.0 / (1.0 + std::exp(-z));
}

double activate(Activation act, double z) {
    switch (act) {
        case Activation::Relu: return z > 0.0 ? z : 0.0;
        case Activation::Sigmoid: return sigmoid(z);
        case Activation::Tanh: return std::tanh(z);
        case Activation::LeakyRelu: return z > 0.0 ? z : kLeakySlope * z;
        case Activation::Gelu: return 0.5 * z * (1.0 + std::erf(z / std::sqrt(2.0)));
    }
    return z;
}

// Производная по предактивации z
double derivative(Activation act, double z) {
    switch (act) {
        case Activation::Relu: return z > 0.0 ? 1.0 : 0.0;
        case Activation::Sigmoid: {
            const double s = sigmoid(z);
            return s * (1.0 - s);
        }
        case Activation::Tanh: {
            const double t = std::tanh(z);
            return 1.0 - t * t;
        }
        case Activation::LeakyRelu: return z > 0.0 ? 1.0 : kLeakySlope;
        case Activation::Gelu: {
            const double cdf = 0.5 * (1.0 + std::erf(z / std::sqrt(2.0)));
            const double pdf = std::exp(-0.5 * z * z) / std::sqrt(2.0 * kPi);
            return cdf + z * pdf;
        }
    }
    return 1.0;
}

bool isLittleEndian() {
    uint16_t number = 0x1;
    const auto* bytes = reinterpret_cast<const unsigned char*>(&number);
    return bytes[0] == 1;
}

template <typename T>
void appendLE(std::vector<uint8_t>& out, T value) {
    unsigned char raw[sizeof(T)];
    std::memcpy(raw, &value, sizeof(T));
    if (!isLittleEndian()) std::reverse(raw, raw + sizeof(T));
    out.insert(out.end(), raw, raw + sizeof(T));
}

template <typename T>
T readLE(const std::vector<uint8_t>& in, size_t& offset) {
    if (offset + sizeof(T) > in.size()) {
        throw KernelError("Weight payload is truncated");
    }
    unsigned char raw[sizeof(T)];
    std::memcpy(raw, in.data() + offset, sizeof(T));
    if (!isLittleEndian()) std::reverse(raw, raw + sizeof(T));
    offset += sizeof(T);
    T value;
    std::memcpy(&value, raw, sizeof(T));
    return value;
}

double elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

// Сеть: слой l хранит матрицу весов weights[l] размером arch[l+1] x arch[l] (row-major)
struct CpuComputeKernel::Network {
    std::vector<size_t> arch;
    Activation hidden = Activation::Relu;
    double learningRate = 0.05;
    double momentum = 0.9;
    size_t batchSize = 32;
    std::string regularization; // "", l1, l2, dropout
    double regularizationValue = 0.0;
    size_t bytes = 0;

    std::vector<std::vector<float>> weights;
    std::vector<std::vector<float>> biases;
    std::vector<std::vector<float>> weightVelocity;
    std::vector<std::vector<float>> biasVelocity;
    std::mt19937 rng;
    mutable std::shared_mutex mutex; // forward: shared, обучение/загрузка весов: exclusive

    size_t layerCount() const { return arch.size() - 1; }

    void initialize(uint32_t seed) {
        rng.seed(seed);
        weights.resize(layerCount());
        biases.resize(layerCount());
        weightVelocity.resize(layerCount());
        biasVelocity.resize(layerCount());
        for (size_t l = 0; l < layerCount(); ++l) {
            const size_t in = arch[l];
            const size_t out = arch[l + 1];
            // Xavier/Glorot uniform
            const double limit = std::sqrt(6.0 / static_cast<double>(in + out));
            std::uniform_real_distribution<double> dist(-limit, limit);
            weights[l].resize(in * out);
            for (auto& w : weights[l]) w = static_cast<float>(dist(rng));
            biases[l].assign(out, 0.0f);
            weightVelocity[l].assign(in * out, 0.0f);
            biasVelocity[l].assign(out, 0.0f);
        }
    }

    // Прямой проход; сохраняет предактивации z и активации a для обратного прохода.
    // a[0]: вход, a[L]: выход.
    void forward(const std::vector<double>& input,
                 std::vector<std::vector<double>>& z,
                 std::vector<std::vector<double>>& a,
                 const CancellationToken* token,
                 const std::vector<std::vector<double>>* dropoutMasks = nullptr) const {
        z.assign(layerCount() + 1, {});
        a.assign(layerCount() + 1, {});
        a[0] = input;
        for (size_t l = 0; l < layerCount(); ++l) {
            if (token && token->isCancelled()) {
                throw KernelError("Inference cancelled");
            }
            const size_t in = arch[l];
            const size_t out = arch[l + 1];
            const bool isOutput = (l + 1 == layerCount());
            z[l + 1].resize(out);
            a[l + 1].resize(out);
            const auto& w = weights[l];
            for (size_t o = 0; o < out; ++o) {
                double sum = biases[l][o];
                const float* row = &w[o * in];
                for (size_t i = 0; i < in; ++i) {
                    sum += static_cast<double>(row[i]) * a[l][i];
                }
                z[l + 1][o] = sum;
                a[l + 1][o] = isOutput ? sigmoid(sum) : activate(hidden, sum);
                if (!isOutput && dropoutMasks) {
                    a[l + 1][o] *= (*dropoutMasks)[l + 1][o];
                }
            }
        }
    }

    double sampleLoss(const std::vector<double>& output, const std::vector<double>& target) const {
        double err = 0.0;
        for (size_t j = 0; j < output.size(); ++j) {
            const double d = output[j] - target[j];
            err += d * d;
        }
        return err / static_cast<double>(output.size());
    }

    double evaluate(const std::vector<agent::TrainingSample>& data) const {
        std::vector<std::vector<double>> z, a;
        double total = 0.0;
        for (const auto& sample : data) {
            forward(sample.inputs, z, a, nullptr);
            total += sampleLoss(a.back(), sample.outputs);
        }
        return data.empty() ? 0.0 : total / static_cast<double>(data.size());
    }

    // Одна эпоха mini-batch SGD, возвращает среднюю ошибку до обновлений
    double trainEpoch(const std::vector<agent::TrainingSample>& data) {
        std::vector<size_t> order(data.size());
        std::iota(order.begin(), order.end(), 0);
        std::shuffle(order.begin(), order.end(), rng);

        const bool useDropout = regularization == "dropout" && regularizationValue > 0.0 && regularizationValue < 1.0;
        std::bernoulli_distribution keep(useDropout ? 1.0 - regularizationValue : 1.0);

        std::vector<std::vector<double>> gradW(layerCount()), gradB(layerCount());
        std::vector<std::vector<double>> z, a, masks;
        double epochLoss = 0.0;

        for (size_t start = 0; start < order.size(); start += batchSize) {
            const size_t end = std::min(order.size(), start + batchSize);
            for (size_t l = 0; l < layerCount(); ++l) {
                gradW[l].assign(weights[l].size(), 0.0);
                gradB[l].assign(biases[l].size(), 0.0);
            }

            for (size_t idx = start; idx < end; ++idx) {
                const auto& sample = data[order[idx]];
                const std::vector<std::vector<double>>* maskPtr = nullptr;
                if (useDropout) {
                    masks.assign(layerCount() + 1, {});
                    for (size_t l = 1; l < layerCount(); ++l) {
                        masks[l].resize(arch[l]);
                        for (auto& m : masks[l]) m = keep(rng) ? 1.0 / (1.0 - regularizationValue) : 0.0;
                    }
                    maskPtr = &masks;
                }
                forward(sample.inputs, z, a, nullptr, maskPtr);
                epochLoss += sampleLoss(a.back(), sample.outputs);

                // delta выходного слоя: d(MSE)/dz для sigmoid
                std::vector<double> delta(arch.back());
                for (size_t o = 0; o < delta.size(); ++o) {
                    const double out = a.back()[o];
                    delta[o] = 2.0 * (out - sample.outputs[o]) / static_cast<double>(delta.size()) * out * (1.0 - out);
                }

                for (size_t l = layerCount(); l-- > 0;) {
                    const size_t in = arch[l];
                    const size_t out = arch[l + 1];
                    for (size_t o = 0; o < out; ++o) {
                        gradB[l][o] += delta[o];
                        for (size_t i = 0; i < in; ++i) {
                            gradW[l][o * in + i] += delta[o] * a[l][i];
                        }
                    }
                    if (l == 0) break;
                    std::vector<double> prev(in, 0.0);
                    for (size_t i = 0; i < in; ++i) {
                        double sum = 0.0;
                        for (size_t o = 0; o < out; ++o) {
                            sum += static_cast<double>(weights[l][o * in + i]) * delta[o];
                        }
                        double d = sum * derivative(hidden, z[l][i]);
                        if (maskPtr) d *= masks[l][i];
                        prev[i] = d;
                    }
                    delta.swap(prev);
                }
            }

            const double scale = 1.0 / static_cast<double>(end - start);
            for (size_t l = 0; l < layerCount(); ++l) {
                for (size_t k = 0; k < weights[l].size(); ++k) {
                    double g = gradW[l][k] * scale;
                    if (regularization == "l2") g += regularizationValue * weights[l][k];
                    else if (regularization == "l1") g += regularizationValue * (weights[l][k] > 0.0f ? 1.0 : (weights[l][k] < 0.0f ? -1.0 : 0.0));
                    weightVelocity[l][k] = static_cast<float>(momentum * weightVelocity[l][k] - learningRate * g);
                    weights[l][k] += weightVelocity[l][k];
                }
                for (size_t k = 0; k < biases[l].size(); ++k) {
                    biasVelocity[l][k] = static_cast<float>(momentum * biasVelocity[l][k] - learningRate * gradB[l][k] * scale);
                    biases[l][k] += biasVelocity[l][k];
                }
            }
        }
        return epochLoss / static_cast<double>(data.size());
    }
};

CpuComputeKernel::CpuComputeKernel(const CpuKernelConfig& config) : config_(config) {
    if (!config_.validate()) {
        throw KernelError("CpuComputeKernel: invalid configuration", false);
    }
    thread::ThreadPoolConfig poolConfig;
    poolConfig.minThreads = config_.minThreads;
    poolConfig.maxThreads = config_.maxThreads;
    poolConfig.queueSize = 1024;
    poolConfig.name = "cpu-kernel";
    pool_ = std::make_unique<thread::ThreadPool>(poolConfig);
    spdlog::info("CpuComputeKernel: создан (потоки {}..{})", config_.minThreads, config_.maxThreads);
}

CpuComputeKernel::~CpuComputeKernel() {
    pool_->stop();
    spdlog::debug("CpuComputeKernel: уничтожен, сетей осталось {}", networkCount());
}

std::shared_ptr<CpuComputeKernel::Network> CpuComputeKernel::findNetwork(NetworkHandle handle) const {
    std::lock_guard<std::mutex> lock(networksMutex_);
    auto it = networks_.find(handle);
    if (it == networks_.end()) {
        throw KernelError("Unknown network handle: " + std::to_string(handle));
    }
    return it->second;
}

std::future<NetworkHandle> CpuComputeKernel::createNetwork(const agent::NeuralConfiguration& config) {
    return pool_->submit([this, config]() -> NetworkHandle {
        if (config.type != "mlp" && config.type != "custom") {
            throw KernelError("Unsupported network type for CPU kernel: " + config.type);
        }
        if (config.architecture.size() < 2) {
            throw KernelError("CPU kernel requires at least input and output layers");
        }
        auto network = std::make_shared<Network>();
        network->arch = config.architecture;
        network->hidden = parseActivation(config.activationFunction);
        network->learningRate = config.learningRate.value_or(config_.defaultLearningRate);
        network->momentum = config.momentum.value_or(config_.defaultMomentum);
        network->batchSize = std::max<size_t>(1, config.batchSize);
        if (config.regularization) {
            network->regularization = config.regularization->type;
            network->regularizationValue = config.regularization->value;
        }

        const NetworkHandle handle = nextHandle_.fetch_add(1);
        network->initialize(config_.seed + static_cast<uint32_t>(handle));

        size_t params = 0;
        for (size_t l = 0; l < network->layerCount(); ++l) {
            params += network->weights[l].size() + network->biases[l].size();
        }
        // Веса + скорости момента
        network->bytes = params * sizeof(float) * 2;

        {
            std::lock_guard<std::mutex> lock(networksMutex_);
            networks_[handle] = network;
        }
        memoryUsage_ += network->bytes;
        spdlog::debug("CpuComputeKernel: сеть {} создана, параметров {}, {} байт", handle, params, network->bytes);
        return handle;
    });
}

std::future<std::vector<double>> CpuComputeKernel::runInference(NetworkHandle handle,
                                                                const std::vector<double>& inputs,
                                                                CancellationToken token) {
    return pool_->submit([this, handle, inputs, token]() -> std::vector<double> {
        auto network = findNetwork(handle);
        if (inputs.size() != network->arch.front()) {
            throw KernelError("Input size mismatch: expected " + std::to_string(network->arch.front()) +
                              ", got " + std::to_string(inputs.size()));
        }
        std::shared_lock<std::shared_mutex> lock(network->mutex);
        std::vector<std::vector<double>> z, a;
        network->forward(inputs, z, a, &token);
        return a.back();
    });
}

std::future<TrainingResult> CpuComputeKernel::trainNetwork(NetworkHandle handle,
                                                           const std::vector<agent::TrainingSample>& data,
                                                           size_t epochs) {
    return pool_->submit([this, handle, data, epochs]() -> TrainingResult {
        auto network = findNetwork(handle);
        if (data.empty()) {
            throw KernelError("Training data is empty");
        }
        for (const auto& sample : data) {
            if (sample.inputs.size() != network->arch.front() || sample.outputs.size() != network->arch.back()) {
                throw KernelError("Training sample does not match network architecture");
            }
        }

        const auto start = std::chrono::steady_clock::now();
        std::unique_lock<std::shared_mutex> lock(network->mutex);
        TrainingResult result;
        result.convergenceEpoch = epochs;
        for (size_t epoch = 0; epoch < epochs; ++epoch) {
            const double loss = network->trainEpoch(data);
            if (!std::isfinite(loss)) {
                // Веса разошлись, сеть больше непригодна
                throw KernelError("Training diverged at epoch " + std::to_string(epoch + 1), false);
            }
            if (!result.converged && loss < config_.convergenceThreshold) {
                result.converged = true;
                result.convergenceEpoch = epoch + 1;
            }
        }
        result.loss = network->evaluate(data);
        result.accuracy = std::clamp(1.0 - result.loss, 0.0, 1.0);
        if (epochs == 0) {
            result.convergenceEpoch = 0;
            result.converged = result.loss < config_.convergenceThreshold;
        }
        result.trainingTime = elapsedMs(start);
        spdlog::debug("CpuComputeKernel: сеть {} обучена: {} эпох, loss={:.5f}, accuracy={:.3f}",
                      handle, epochs, result.loss, result.accuracy);
        return result;
    });
}

std::future<std::vector<uint8_t>> CpuComputeKernel::serializeWeights(NetworkHandle handle) {
    return pool_->submit([this, handle]() -> std::vector<uint8_t> {
        auto network = findNetwork(handle);
        std::shared_lock<std::shared_mutex> lock(network->mutex);
        std::vector<uint8_t> out;
        appendLE<uint32_t>(out, kWeightsMagic);
        appendLE<uint32_t>(out, kWeightsVersion);
        appendLE<uint32_t>(out, static_cast<uint32_t>(network->arch.size()));
        for (size_t width : network->arch) {
            appendLE<uint32_t>(out, static_cast<uint32_t>(width));
        }
        for (size_t l = 0; l < network->layerCount(); ++l) {
            for (float w : network->weights[l]) appendLE<float>(out, w);
            for (float b : network->biases[l]) appendLE<float>(out, b);
        }
        return out;
    });
}

std::future<void> CpuComputeKernel::deserializeWeights(NetworkHandle handle,
                                                       const std::vector<uint8_t>& weights,
                                                       double influence) {
    return pool_->submit([this, handle, weights, influence]() {
        if (!(influence >= 0.0 && influence <= 1.0)) {
            throw KernelError("Blend influence must lie in [0, 1]");
        }
        auto network = findNetwork(handle);
        size_t offset = 0;
        if (readLE<uint32_t>(weights, offset) != kWeightsMagic) {
            throw KernelError("Weight payload has wrong magic");
        }
        const uint32_t version = readLE<uint32_t>(weights, offset);
        if (version != kWeightsVersion) {
            throw KernelError("Unsupported weight payload version " + std::to_string(version));
        }
        const uint32_t layers = readLE<uint32_t>(weights, offset);
        std::vector<size_t> arch(layers);
        for (auto& width : arch) width = readLE<uint32_t>(weights, offset);
        if (arch != network->arch) {
            throw KernelError("Weight payload architecture does not match network " + std::to_string(handle));
        }

        // Сначала разбираем весь payload, потом смешиваем: повреждённые данные не трогают сеть
        std::vector<std::vector<float>> newWeights(network->layerCount()), newBiases(network->layerCount());
        for (size_t l = 0; l < network->layerCount(); ++l) {
            newWeights[l].resize(arch[l] * arch[l + 1]);
            newBiases[l].resize(arch[l + 1]);
            for (auto& w : newWeights[l]) w = readLE<float>(weights, offset);
            for (auto& b : newBiases[l]) b = readLE<float>(weights, offset);
        }
        if (offset != weights.size()) {
            throw KernelError("Weight payload has trailing bytes");
        }

        std::unique_lock<std::shared_mutex> lock(network->mutex);
        const float keep = static_cast<float>(1.0 - influence);
        const float take = static_cast<float>(influence);
        for (size_t l = 0; l < network->layerCount(); ++l) {
            for (size_t k = 0; k < newWeights[l].size(); ++k) {
                network->weights[l][k] = network->weights[l][k] * keep + newWeights[l][k] * take;
            }
            for (size_t k = 0; k < newBiases[l].size(); ++k) {
                network->biases[l][k] = network->biases[l][k] * keep + newBiases[l][k] * take;
            }
        }
    });
}

void CpuComputeKernel::destroyNetwork(NetworkHandle handle) {
    std::shared_ptr<Network> network;
    {
        std::lock_guard<std::mutex> lock(networksMutex_);
        auto it = networks_.find(handle);
        if (it == networks_.end()) return;
        network = it->second;
        networks_.erase(it);
    }
    memoryUsage_ -= network->bytes;
    spdlog::debug("CpuComputeKernel: сеть {} уничтожена", handle);
}

size_t CpuComputeKernel::currentMemoryUsage() const {
    return memoryUsage_.load();
}

std::string CpuComputeKernel::getName() const {
    return "cpu";
}

size_t CpuComputeKernel::networkCount() const {
    std::lock_guard<std::mutex> lock(networksMutex_);
    return networks_.size();
}

} // namespace kernel
} // namespace core
} // namespace synapse
