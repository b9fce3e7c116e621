#include "core/inference/InferenceScheduler.hpp"
#include <shared_mutex>
#include <utility>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace inference {

using agent::AgentState;

namespace {

// Как часто таймер проверяет отменённые вызовы ядра
constexpr std::chrono::milliseconds kLateCallPoll{5};

agent::TimeoutError timeoutError(const std::string& agentId, std::chrono::milliseconds timeout) {
    return agent::TimeoutError("Inference on " + agentId + " timed out after " +
                               std::to_string(timeout.count()) + " ms");
}

} // namespace

InferenceScheduler::InferenceScheduler(agent::AgentRegistry& registry,
                                       kernel::IComputeKernel& kernel,
                                       metrics::PerformanceMonitor& monitor,
                                       events::EventNotifier& events,
                                       thread::ThreadPool& pool,
                                       std::chrono::milliseconds defaultTimeout)
    : registry_(registry), kernel_(kernel), monitor_(monitor), events_(events),
      pool_(pool), defaultTimeout_(defaultTimeout) {
    timer_ = std::thread(&InferenceScheduler::timerLoop, this);
}

InferenceScheduler::~InferenceScheduler() {
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        stopping_ = true;
    }
    timerCv_.notify_all();
    if (timer_.joinable()) timer_.join();

    // Замки агентов не должны пережить планировщик
    for (auto& late : lateCalls_) {
        try {
            late.pending.get();
        } catch (const std::exception& e) {
            spdlog::debug("[Inference] {}: отменённый вызов ядра завершился ошибкой: {}", late.agentId, e.what());
        }
        late.slot->endLateCall();
    }
    for (auto& [deadline, call] : deadlines_) {
        if (call->claim()) {
            call->promise.set_exception(std::make_exception_ptr(
                agent::TimeoutError("Inference on " + call->agentId + " aborted: scheduler stopped")));
        }
    }
}

std::future<std::vector<double>> InferenceScheduler::infer(const std::string& agentId,
                                                           std::vector<double> inputs,
                                                           std::optional<std::chrono::milliseconds> timeout) {
    const auto limit = timeout.value_or(defaultTimeout_);
    if (limit.count() <= 0) {
        throw agent::ConfigurationError("Inference timeout must be positive");
    }
    auto slot = registry_.acquire(agentId);
    const auto snapshot = registry_.get(agentId);
    if (!snapshot) throw agent::NotFoundError(agentId);
    const AgentState state = snapshot->state;
    if (state != AgentState::Active && state != AgentState::Learning) {
        throw agent::StateConflictError("Agent " + agentId + " cannot run inference while " +
                                        agent::toString(state));
    }
    const size_t expected = snapshot->config.architecture.front();
    if (inputs.size() != expected) {
        throw agent::ConfigurationError("Agent " + agentId + " expects " + std::to_string(expected) +
                                        " inputs, got " + std::to_string(inputs.size()));
    }

    auto call = std::make_shared<Call>();
    call->agentId = agentId;
    call->timeout = limit;
    call->deadline = Clock::now() + limit;
    auto result = call->promise.get_future();
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        deadlines_.emplace(call->deadline, call);
    }
    timerCv_.notify_one();

    try {
        pool_.enqueue([this, slot, call, inputs = std::move(inputs)]() { execute(slot, call, inputs); });
    } catch (const std::exception& e) {
        // Таймер не должен завершить вызов, который не был принят
        call->claim();
        spdlog::error("[Inference] {}: не удалось поставить задачу: {}", agentId, e.what());
        throw;
    }
    return result;
}

void InferenceScheduler::execute(const std::shared_ptr<agent::AgentSlot>& slot,
                                 const std::shared_ptr<Call>& call,
                                 const std::vector<double>& inputs) {
    const std::string& agentId = call->agentId;
    // Ожидание замка входит в бюджет времени
    std::shared_lock<std::shared_timed_mutex> gate(slot->gate, std::defer_lock);
    if (!gate.try_lock_until(call->deadline)) {
        expire(call);
        return;
    }
    if (call->settled.load()) {
        spdlog::debug("[Inference] {}: дедлайн истёк в очереди, ядро не вызывается", agentId);
        return;
    }
    if (slot->removed.load()) {
        if (call->claim()) {
            call->promise.set_exception(std::make_exception_ptr(agent::NotFoundError(agentId)));
        }
        return;
    }

    const auto start = Clock::now();
    std::future<std::vector<double>> pending;
    try {
        pending = kernel_.runInference(slot->network, inputs, call->token);
    } catch (const agent::KernelError& e) {
        if (call->claim()) {
            handleKernelFailure(agentId, e);
            call->promise.set_exception(std::current_exception());
        }
        return;
    } catch (const std::exception& e) {
        if (call->claim()) {
            agent::KernelError wrapped(std::string("Kernel inference failed: ") + e.what());
            handleKernelFailure(agentId, wrapped);
            call->promise.set_exception(std::make_exception_ptr(wrapped));
        }
        return;
    }

    if (pending.wait_until(call->deadline) == std::future_status::timeout) {
        expire(call);
        // Рабочий поток свободен, ответ ядра дождётся таймер
        slot->beginLateCall();
        adoptLateCall(LateCall{slot, agentId, std::move(pending)});
        return;
    }

    std::vector<double> outputs;
    try {
        outputs = pending.get();
    } catch (const agent::KernelError& e) {
        if (call->claim()) {
            handleKernelFailure(agentId, e);
            call->promise.set_exception(std::current_exception());
        }
        return;
    } catch (const std::exception& e) {
        if (call->claim()) {
            agent::KernelError wrapped(std::string("Kernel inference failed: ") + e.what());
            handleKernelFailure(agentId, wrapped);
            call->promise.set_exception(std::make_exception_ptr(wrapped));
        }
        return;
    }
    if (!call->claim()) {
        spdlog::debug("[Inference] {}: ответ ядра пришёл на границе дедлайна и отброшен", agentId);
        return;
    }

    const double elapsedMs = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    registry_.recordInference(agentId, elapsedMs);
    monitor_.recordInference(elapsedMs);
    events_.notify(events::EventType::InferenceComplete, {
        {"agentId", agentId},
        {"inferenceTime", elapsedMs},
        {"inputSize", inputs.size()},
        {"outputSize", outputs.size()}
    });
    call->promise.set_value(std::move(outputs));
}

void InferenceScheduler::expire(const std::shared_ptr<Call>& call) {
    if (!call->claim()) return;
    call->token.cancel();
    monitor_.recordTimeout();
    spdlog::warn("[Inference] {}: превышен таймаут {} мс, вызов отменён", call->agentId, call->timeout.count());
    call->promise.set_exception(std::make_exception_ptr(timeoutError(call->agentId, call->timeout)));
}

void InferenceScheduler::adoptLateCall(LateCall late) {
    {
        std::lock_guard<std::mutex> lock(timerMutex_);
        lateCalls_.push_back(std::move(late));
    }
    timerCv_.notify_one();
}

size_t InferenceScheduler::lateCalls() const {
    std::lock_guard<std::mutex> lock(timerMutex_);
    return lateCalls_.size();
}

void InferenceScheduler::timerLoop() {
    std::unique_lock<std::mutex> lock(timerMutex_);
    while (!stopping_) {
        const auto now = Clock::now();
        std::vector<std::shared_ptr<Call>> expired;
        while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
            expired.push_back(std::move(deadlines_.begin()->second));
            deadlines_.erase(deadlines_.begin());
        }
        std::vector<LateCall> returned;
        for (auto it = lateCalls_.begin(); it != lateCalls_.end();) {
            if (it->pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                returned.push_back(std::move(*it));
                it = lateCalls_.erase(it);
            } else {
                ++it;
            }
        }

        if (!expired.empty() || !returned.empty()) {
            lock.unlock();
            for (const auto& call : expired) expire(call);
            for (auto& late : returned) {
                try {
                    late.pending.get();
                    spdlog::debug("[Inference] {}: поздний ответ ядра отброшен", late.agentId);
                } catch (const std::exception& e) {
                    spdlog::debug("[Inference] {}: отменённый вызов ядра завершился ошибкой: {}",
                                  late.agentId, e.what());
                }
                late.slot->endLateCall();
            }
            lock.lock();
            continue;
        }

        if (!lateCalls_.empty()) {
            auto wake = now + kLateCallPoll;
            if (!deadlines_.empty() && deadlines_.begin()->first < wake) wake = deadlines_.begin()->first;
            timerCv_.wait_until(lock, wake);
        } else if (!deadlines_.empty()) {
            timerCv_.wait_until(lock, deadlines_.begin()->first);
        } else {
            timerCv_.wait(lock);
        }
    }
}

void InferenceScheduler::handleKernelFailure(const std::string& agentId, const agent::KernelError& error) {
    monitor_.recordError();
    spdlog::error("[Inference] {}: ошибка ядра: {}", agentId, error.what());
    if (!error.recoverable()) {
        registry_.markError(agentId);
        events_.notify(events::EventType::Error, {
            {"agentId", agentId},
            {"operation", "inference"},
            {"error", error.what()},
            {"recoverable", false}
        });
    }
}

} // namespace inference
} // namespace core
} // namespace synapse
