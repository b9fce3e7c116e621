#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include "core/agent/AgentErrors.hpp"
#include "core/agent/AgentTypes.hpp"
#include "core/agent/ManagerConfig.hpp"
#include "core/logging/Logging.hpp"

using namespace synapse::core;
using namespace synapse::core::agent;

template <typename Error, typename F>
bool throwsAs(F&& f) {
    try {
        f();
    } catch (const Error&) {
        return true;
    }
    return false;
}

NeuralConfiguration validConfig() {
    NeuralConfiguration config;
    config.type = "mlp";
    config.architecture = {4, 8, 2};
    config.activationFunction = "sigmoid";
    config.learningRate = 0.05;
    return config;
}

void testNormalization() {
    std::cout << "Testing NeuralConfiguration normalization...\n";

    auto normalized = normalizeConfiguration(validConfig());
    assert(normalized.activationFunction == "sigmoid");
    assert(normalized.architecture.size() == 3);

    auto unknownActivation = validConfig();
    unknownActivation.activationFunction = "swish";
    assert(normalizeConfiguration(unknownActivation).activationFunction == "relu");
    unknownActivation.activationFunction = "";
    assert(normalizeConfiguration(unknownActivation).activationFunction == "relu");

    std::cout << "[OK] NeuralConfiguration normalization test\n";
}

void testValidationErrors() {
    std::cout << "Testing NeuralConfiguration validation errors...\n";

    auto c = validConfig();
    c.architecture.clear();
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));

    c = validConfig();
    c.architecture = {4, 0, 1};
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));

    c = validConfig();
    c.type = "";
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));
    c.type = "perceptron";
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));

    c = validConfig();
    c.learningRate = 0.0;
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));
    c.learningRate = 1.5;
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));
    c.learningRate = 1.0;
    normalizeConfiguration(c);

    c = validConfig();
    c.momentum = 1.0;
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));

    c = validConfig();
    c.regularization = Regularization{"l3", 0.1};
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));
    c.regularization = Regularization{"l2", -0.1};
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));

    c = validConfig();
    c.batchSize = 0;
    assert(throwsAs<ConfigurationError>([&]() { normalizeConfiguration(c); }));

    // Все ошибки: наследники NeuralAgentError с нужным kind
    try {
        c = validConfig();
        c.epochs = 0;
        normalizeConfiguration(c);
        assert(false);
    } catch (const NeuralAgentError& e) {
        assert(e.kind() == ErrorKind::Configuration);
        assert(std::string(toString(e.kind())) == "ConfigurationError");
    }

    std::cout << "[OK] NeuralConfiguration validation test\n";
}

void testConfigurationJson() {
    std::cout << "Testing NeuralConfiguration JSON...\n";

    auto config = validConfig();
    config.momentum = 0.5;
    config.regularization = Regularization{"l1", 0.001};
    auto j = config.toJson();
    assert(j["type"] == "mlp");
    assert(j["architecture"].size() == 3);
    assert(j["regularization"]["type"] == "l1");

    auto parsed = NeuralConfiguration::fromJson(j);
    assert(parsed.architecture == config.architecture);
    assert(parsed.learningRate && *parsed.learningRate == 0.05);
    assert(parsed.momentum && *parsed.momentum == 0.5);
    assert(parsed.regularization && parsed.regularization->value == 0.001);

    nlohmann::json bad = {{"architecture", "wide"}};
    assert(throwsAs<ConfigurationError>([&]() { NeuralConfiguration::fromJson(bad); }));

    std::cout << "[OK] NeuralConfiguration JSON test\n";
}

void testManagerConfig() {
    std::cout << "Testing NeuralAgentManagerConfig...\n";

    NeuralAgentManagerConfig defaults;
    assert(defaults.validate());
    assert(defaults.maxAgents == 25);
    assert(defaults.memoryLimitPerAgent == 50u * 1024 * 1024);
    assert(defaults.inferenceTimeout.count() == 100);
    assert(defaults.crossLearningEnabled);
    assert(defaults.effectiveAggregateLimit() == 25u * 50 * 1024 * 1024);

    auto j = nlohmann::json::parse(R"({
        "maxAgents": 5,
        "inferenceTimeoutMs": 250,
        "crossLearningEnabled": false,
        "aggregateMemoryLimit": 104857600,
        "logging": {"level": "debug", "console": false}
    })");
    auto config = NeuralAgentManagerConfig::fromJson(j);
    assert(config.maxAgents == 5);
    assert(config.inferenceTimeout.count() == 250);
    assert(!config.crossLearningEnabled);
    assert(config.effectiveAggregateLimit() == 104857600u);
    assert(config.logging.level == "debug");
    assert(!config.logging.console);

    auto roundTrip = NeuralAgentManagerConfig::fromJson(config.toJson());
    assert(roundTrip.maxAgents == config.maxAgents);
    assert(roundTrip.knowledgeInfluence == config.knowledgeInfluence);

    assert(throwsAs<ConfigurationError>([]() {
        NeuralAgentManagerConfig::fromJson(nlohmann::json::parse(R"({"maxAgents": 0})"));
    }));
    assert(throwsAs<ConfigurationError>([]() {
        NeuralAgentManagerConfig::fromJson(nlohmann::json::parse(R"({"maxAgents": "many"})"));
    }));
    assert(throwsAs<ConfigurationError>([]() {
        NeuralAgentManagerConfig::fromJson(nlohmann::json::parse(R"({"knowledgeInfluence": 2.0})"));
    }));
    assert(throwsAs<ConfigurationError>([]() { NeuralAgentManagerConfig::fromJson(nlohmann::json::array()); }));

    std::cout << "[OK] NeuralAgentManagerConfig test\n";
}

void testConfigFile() {
    std::cout << "Testing NeuralAgentManagerConfig file loading...\n";

    const std::string path = "synapse_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"maxAgents": 3, "performanceMonitoring": false})";
    }
    auto config = NeuralAgentManagerConfig::loadFromFile(path);
    assert(config.maxAgents == 3);
    assert(!config.performanceMonitoring);
    std::remove(path.c_str());

    assert(throwsAs<ConfigurationError>([]() {
        NeuralAgentManagerConfig::loadFromFile("does_not_exist_synapse.json");
    }));

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    assert(throwsAs<ConfigurationError>([&]() { NeuralAgentManagerConfig::loadFromFile(path); }));
    std::remove(path.c_str());

    std::cout << "[OK] NeuralAgentManagerConfig file test\n";
}

void testLoggingConfig() {
    std::cout << "Testing logging configuration...\n";

    assert(logging::parseLevel("debug") == spdlog::level::debug);
    assert(logging::parseLevel("warning") == spdlog::level::warn);
    assert(logging::parseLevel("nonsense") == spdlog::level::info);

    logging::LoggingConfig config;
    config.level = "warn";
    assert(logging::initializeLogging(config, "config_test"));
    assert(spdlog::default_logger()->level() == spdlog::level::warn);

    logging::LoggingConfig invalid;
    invalid.logPath = "logs/x.log";
    invalid.maxLogFiles = 0;
    assert(!invalid.validate());
    assert(!logging::initializeLogging(invalid, "config_test_invalid"));

    std::cout << "[OK] logging configuration test\n";
}

int main() {
    try {
        testNormalization();
        testValidationErrors();
        testConfigurationJson();
        testManagerConfig();
        testConfigFile();
        testLoggingConfig();
        std::cout << "All agent configuration tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Agent configuration test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
