#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <random>
#include <signal.h>
#include <chrono>
#include <thread>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "core/agent/AgentErrors.hpp"
#include "core/agent/ManagerConfig.hpp"
#include "core/agent/NeuralAgentManager.hpp"
#include "core/kernel/CpuComputeKernel.hpp"
#include "core/logging/Logging.hpp"

using namespace synapse::core;

// Global variables for graceful shutdown
std::atomic<bool> g_running{true};
std::shared_ptr<agent::NeuralAgentManager> g_manager;

// Signal handler for graceful shutdown
void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

// Конфигурация: путь к JSON первым аргументом, иначе значения по умолчанию
agent::NeuralAgentManagerConfig loadConfiguration(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg != "--once") {
            return agent::NeuralAgentManagerConfig::loadFromFile(arg);
        }
    }
    agent::NeuralAgentManagerConfig config;
    config.maxAgents = 8;
    config.monitoringInterval = std::chrono::milliseconds(5000);
    return config;
}

bool hasFlag(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

// Синтетическая задача: выход 1, если сумма входов положительна
std::vector<agent::TrainingSample> makeTrainingData(size_t inputs, size_t count, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    std::vector<agent::TrainingSample> data;
    data.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        agent::TrainingSample sample;
        double sum = 0.0;
        for (size_t k = 0; k < inputs; ++k) {
            sample.inputs.push_back(dist(rng));
            sum += sample.inputs.back();
        }
        sample.outputs.push_back(sum > 0.0 ? 1.0 : 0.0);
        data.push_back(std::move(sample));
    }
    return data;
}

std::vector<std::string> spawnPopulation(size_t count) {
    agent::NeuralConfiguration config;
    config.type = "mlp";
    config.architecture = {8, 16, 1};
    config.activationFunction = "tanh";
    config.learningRate = 0.1;
    config.epochs = 20;

    std::vector<std::future<std::string>> pending;
    for (size_t i = 0; i < count; ++i) {
        pending.push_back(g_manager->spawnAgent(config));
    }
    std::vector<std::string> ids;
    for (auto& f : pending) {
        ids.push_back(f.get());
    }
    spdlog::info("[init] создано агентов: {}", ids.size());
    return ids;
}

// Main service loop
void runServiceLoop(const std::vector<std::string>& ids, bool once) {
    spdlog::info("Starting service loop...");
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    auto lastMetricsUpdate = std::chrono::steady_clock::now();
    int loopCount = 0;
    while (g_running) {
        try {
            const std::string& id = ids[static_cast<size_t>(loopCount) % ids.size()];
            if (loopCount % 20 == 0) {
                auto session = g_manager->trainAgent(id, makeTrainingData(8, 64, rng)).get();
                spdlog::info("[loop] {} обучен: точность {:.3f}", id, session.finalAccuracy);
                if (ids.size() > 1) {
                    std::vector<std::string> targets(ids.begin(), ids.end());
                    g_manager->shareKnowledge(id, targets).get();
                }
            }
            std::vector<double> inputs(8);
            for (auto& v : inputs) v = dist(rng);
            auto outputs = g_manager->runInference(id, inputs).get();
            spdlog::debug("[loop] {} -> {:.4f}", id, outputs.front());

            auto now = std::chrono::steady_clock::now();
            if (once || now - lastMetricsUpdate > std::chrono::seconds(5)) {
                spdlog::info("[loop] metrics: {}", g_manager->getPerformanceMetrics().toJson().dump());
                lastMetricsUpdate = now;
            }
            ++loopCount;
            if (once && loopCount >= 1) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        } catch (const agent::NeuralAgentError& e) {
            spdlog::error("Error in service loop ({}): {}", agent::toString(e.kind()), e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    spdlog::info("Service loop stopped");
}

int main(int argc, char* argv[]) {
    try {
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        const auto config = loadConfiguration(argc, argv);
        if (!logging::initializeLogging(config.logging, "synapse_service")) {
            return 1;
        }
        spdlog::info("=== Synapse Agent Service Starting ===");

        kernel::CpuKernelConfig kernelConfig;
        kernelConfig.maxThreads = std::max(1u, std::thread::hardware_concurrency());
        auto computeKernel = std::make_shared<kernel::CpuComputeKernel>(kernelConfig);

        g_manager = std::make_shared<agent::NeuralAgentManager>(config, computeKernel);
        if (!g_manager->initialize()) {
            throw std::runtime_error("Failed to initialize agent manager");
        }
        g_manager->subscribe([](const events::AgentEvent& event) {
            spdlog::debug("[event] {} {}", events::toString(event.type), event.payload.dump());
        });

        const auto ids = spawnPopulation(std::min<size_t>(4, config.maxAgents));
        runServiceLoop(ids, hasFlag(argc, argv, "--once"));

        spdlog::info("[topology] {}", g_manager->getNetworkTopology().toJson().dump());
        g_manager->cleanup().get();
        g_manager.reset();
        spdlog::info("=== Synapse Agent Service Shutdown Complete ===");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
