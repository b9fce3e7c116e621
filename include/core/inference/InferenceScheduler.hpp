#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "core/agent/AgentErrors.hpp"
#include "core/agent/AgentRegistry.hpp"
#include "core/events/EventNotifier.hpp"
#include "core/kernel/ComputeKernel.hpp"
#include "core/metrics/PerformanceMonitor.hpp"
#include "core/thread/ThreadPool.hpp"

namespace synapse {
namespace core {
namespace inference {

// InferenceScheduler: прямой проход с дедлайном.
// Дедлайн отслеживает собственный поток таймера, а не рабочий поток пула: вызывающий
// получает TimeoutError вовремя, даже если пул занят. Отменённый вызов ядра дорабатывает
// в фоне, и пока он не вернулся, exclusive-доступ к агенту не выдаётся (AgentSlot::lockExclusive).
class InferenceScheduler {
public:
    InferenceScheduler(agent::AgentRegistry& registry,
                       kernel::IComputeKernel& kernel,
                       metrics::PerformanceMonitor& monitor,
                       events::EventNotifier& events,
                       thread::ThreadPool& pool,
                       std::chrono::milliseconds defaultTimeout);
    ~InferenceScheduler();
    InferenceScheduler(const InferenceScheduler&) = delete;
    InferenceScheduler& operator=(const InferenceScheduler&) = delete;

    // NotFoundError / StateConflictError / ConfigurationError бросаются синхронно,
    // TimeoutError и KernelError приходят из future
    std::future<std::vector<double>> infer(const std::string& agentId,
                                           std::vector<double> inputs,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::chrono::milliseconds defaultTimeout() const { return defaultTimeout_; }
    size_t lateCalls() const; // Отменённые вызовы ядра, ещё не вернувшиеся
private:
    using Clock = std::chrono::steady_clock;

    // Один вызов: результат достаётся тому, кто первым его заберёт (рабочий поток или таймер)
    struct Call {
        std::string agentId;
        std::chrono::milliseconds timeout{0};
        Clock::time_point deadline;
        kernel::CancellationToken token;
        std::promise<std::vector<double>> promise;
        std::atomic<bool> settled{false};

        bool claim() { return !settled.exchange(true); }
    };

    // Вызов ядра, переживший свой дедлайн
    struct LateCall {
        std::shared_ptr<agent::AgentSlot> slot;
        std::string agentId;
        std::future<std::vector<double>> pending;
    };

    void execute(const std::shared_ptr<agent::AgentSlot>& slot,
                 const std::shared_ptr<Call>& call,
                 const std::vector<double>& inputs);
    void expire(const std::shared_ptr<Call>& call);
    void adoptLateCall(LateCall late);
    void timerLoop();
    void handleKernelFailure(const std::string& agentId, const agent::KernelError& error);

    agent::AgentRegistry& registry_;
    kernel::IComputeKernel& kernel_;
    metrics::PerformanceMonitor& monitor_;
    events::EventNotifier& events_;
    thread::ThreadPool& pool_;
    const std::chrono::milliseconds defaultTimeout_;

    mutable std::mutex timerMutex_;
    std::condition_variable timerCv_;
    std::multimap<Clock::time_point, std::shared_ptr<Call>> deadlines_;
    std::vector<LateCall> lateCalls_;
    bool stopping_ = false;
    std::thread timer_;
};

} // namespace inference
} // namespace core
} // namespace synapse
