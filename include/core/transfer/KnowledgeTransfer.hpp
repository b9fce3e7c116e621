#pragma once
#include <cstdint>
#include <future>
#include <string>
#include <vector>
#include "core/agent/AgentErrors.hpp"
#include "core/agent/AgentRegistry.hpp"
#include "core/events/EventNotifier.hpp"
#include "core/kernel/ComputeKernel.hpp"
#include "core/metrics/PerformanceMonitor.hpp"
#include "core/thread/ThreadPool.hpp"

namespace synapse {
namespace core {
namespace transfer {

// KnowledgeTransfer: копирование обученных весов от одного агента другим.
// Все проверки выполняются до первого обращения к ядру: либо цели существуют все, либо вызов отклонён.
class KnowledgeTransfer {
public:
    KnowledgeTransfer(agent::AgentRegistry& registry,
                      kernel::IComputeKernel& kernel,
                      metrics::PerformanceMonitor& monitor,
                      events::EventNotifier& events,
                      thread::ThreadPool& pool,
                      bool enabled,
                      double influence);

    std::future<void> share(const std::string& sourceId, const std::vector<std::string>& targetIds);

    bool enabled() const { return enabled_; }
    double influence() const { return influence_; }

    // SHA-256 полезной нагрузки в hex
    static std::string checksum(const std::vector<uint8_t>& payload);
private:
    // targetIds: цели без источника; requested: список вызывающего для события
    void run(const std::string& sourceId, const std::vector<std::string>& targetIds,
             const std::vector<std::string>& requested);
    void handleFailure(const std::string& agentId, const agent::KernelError& error);

    agent::AgentRegistry& registry_;
    kernel::IComputeKernel& kernel_;
    metrics::PerformanceMonitor& monitor_;
    events::EventNotifier& events_;
    thread::ThreadPool& pool_;
    const bool enabled_;
    const double influence_;
};

} // namespace transfer
} // namespace core
} // namespace synapse
