#include "core/transfer/KnowledgeTransfer.hpp"
#include "core/agent/AgentErrors.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace transfer {

using agent::AgentState;

namespace {

void requireTransferable(const agent::NeuralAgent& agent) {
    if (agent.state != AgentState::Active && agent.state != AgentState::Learning) {
        throw agent::StateConflictError("Agent " + agent.id + " cannot take part in knowledge transfer while " +
                                        agent::toString(agent.state));
    }
}

int64_t unixMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

KnowledgeTransfer::KnowledgeTransfer(agent::AgentRegistry& registry,
                                     kernel::IComputeKernel& kernel,
                                     metrics::PerformanceMonitor& monitor,
                                     events::EventNotifier& events,
                                     thread::ThreadPool& pool,
                                     bool enabled,
                                     double influence)
    : registry_(registry), kernel_(kernel), monitor_(monitor), events_(events), pool_(pool),
      enabled_(enabled), influence_(influence) {}

std::string KnowledgeTransfer::checksum(const std::vector<uint8_t>& payload) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(payload.data(), payload.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::future<void> KnowledgeTransfer::share(const std::string& sourceId, const std::vector<std::string>& targetIds) {
    if (!enabled_) {
        throw agent::FeatureDisabledError("Cross-agent learning is disabled");
    }
    const auto source = registry_.get(sourceId);
    if (!source) throw agent::NotFoundError(sourceId);

    std::vector<agent::NeuralAgent> targets;
    for (const auto& id : targetIds) {
        auto target = registry_.get(id);
        if (!target) throw agent::NotFoundError(id);
        targets.push_back(std::move(*target));
    }

    std::vector<std::string> effective;
    for (const auto& target : targets) {
        if (target.id == sourceId) {
            spdlog::warn("[Transfer] источник {} указан среди целей, пропускаем", sourceId);
            continue;
        }
        if (target.config.architecture != source->config.architecture) {
            throw agent::ConfigurationError("Architecture of " + target.id + " differs from source " + sourceId);
        }
        requireTransferable(target);
        effective.push_back(target.id);
    }
    requireTransferable(*source);

    if (effective.empty()) {
        // Ядро не вызывается, но о вызове сообщаем как обычно
        spdlog::info("[Transfer] {}: нет целей для передачи знаний", sourceId);
        events_.notify(events::EventType::KnowledgeShared, {
            {"sourceAgentId", sourceId},
            {"targetAgentIds", targetIds},
            {"timestamp", unixMillis()},
            {"payloadSize", 0}
        });
        std::promise<void> done;
        done.set_value();
        return done.get_future();
    }
    return pool_.submit([this, sourceId, effective, requested = targetIds]() { run(sourceId, effective, requested); });
}

void KnowledgeTransfer::run(const std::string& sourceId, const std::vector<std::string>& targetIds,
                            const std::vector<std::string>& requested) {
    // Замки берутся в порядке id: источник shared, цели exclusive
    std::map<std::string, std::shared_ptr<agent::AgentSlot>> slots;
    slots[sourceId] = registry_.acquire(sourceId);
    for (const auto& id : targetIds) {
        if (!slots.count(id)) slots[id] = registry_.acquire(id);
    }
    std::vector<std::shared_lock<std::shared_timed_mutex>> readers;
    std::vector<std::unique_lock<std::shared_timed_mutex>> writers;
    for (auto& [id, slot] : slots) {
        if (id == sourceId) {
            readers.emplace_back(slot->gate);
        } else {
            writers.push_back(slot->lockExclusive());
        }
    }
    for (const auto& [id, slot] : slots) {
        if (slot->removed.load()) throw agent::NotFoundError(id);
    }

    const auto source = slots.at(sourceId);
    std::vector<uint8_t> payload;
    try {
        payload = kernel_.serializeWeights(source->network).get();
    } catch (const agent::KernelError& e) {
        handleFailure(sourceId, e);
        throw;
    }

    for (const auto& id : targetIds) {
        try {
            kernel_.deserializeWeights(slots.at(id)->network, payload, influence_).get();
        } catch (const agent::KernelError& e) {
            handleFailure(id, e);
            throw;
        }
    }

    const std::string digest = checksum(payload);
    spdlog::info("[Transfer] {} -> {} агентов, {} байт, sha256 {}", sourceId, targetIds.size(), payload.size(), digest);
    events_.notify(events::EventType::KnowledgeShared, {
        {"sourceAgentId", sourceId},
        {"targetAgentIds", requested},
        {"timestamp", unixMillis()},
        {"payloadSize", payload.size()},
        {"payloadChecksum", digest}
    });
}

void KnowledgeTransfer::handleFailure(const std::string& agentId, const agent::KernelError& error) {
    monitor_.recordError();
    spdlog::error("[Transfer] {}: ошибка ядра: {}", agentId, error.what());
    if (!error.recoverable()) {
        registry_.markError(agentId);
    }
    events_.notify(events::EventType::Error, {
        {"agentId", agentId},
        {"operation", "knowledgeTransfer"},
        {"error", error.what()},
        {"recoverable", error.recoverable()}
    });
}

} // namespace transfer
} // namespace core
} // namespace synapse
