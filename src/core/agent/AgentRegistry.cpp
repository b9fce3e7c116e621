#include "core/agent/AgentRegistry.hpp"
#include "core/agent/AgentErrors.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace agent {

namespace {

bool contains(const StateSet& states, AgentState state) {
    return std::find(states.begin(), states.end(), state) != states.end();
}

std::string describe(const StateSet& states) {
    std::string out;
    for (AgentState s : states) {
        if (!out.empty()) out += "|";
        out += toString(s);
    }
    return out;
}

} // namespace

void AgentSlot::beginLateCall() {
    std::lock_guard<std::mutex> lock(lateMutex_);
    ++lateCalls_;
}

void AgentSlot::endLateCall() {
    std::lock_guard<std::mutex> lock(lateMutex_);
    if (lateCalls_ > 0) --lateCalls_;
    if (lateCalls_ == 0) lateDone_.notify_all();
}

std::unique_lock<std::shared_timed_mutex> AgentSlot::lockExclusive() {
    std::unique_lock<std::shared_timed_mutex> gateLock(gate);
    // Новые поздние вызовы не появятся: под exclusive инференс не стартует
    std::unique_lock<std::mutex> lock(lateMutex_);
    lateDone_.wait(lock, [this]() { return lateCalls_ == 0; });
    return gateLock;
}

AgentRegistry::AgentRegistry(size_t maxAgents, memory::MemoryGovernor& memory, events::EventNotifier& events)
    : maxAgents_(maxAgents), memory_(memory), events_(events), rng_(std::random_device{}()) {}

void AgentRegistry::reserveCapacity() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (agents_.size() + pending_ >= maxAgents_) {
        spdlog::warn("[Registry] пул агентов заполнен ({} из {})", agents_.size() + pending_, maxAgents_);
        throw CapacityError("Maximum agent count reached (" + std::to_string(maxAgents_) + ")");
    }
    ++pending_;
}

void AgentRegistry::releaseCapacity() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_ > 0) --pending_;
}

std::string AgentRegistry::generateId() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string id;
    do {
        std::ostringstream oss;
        oss << "agent_" << ms << "_" << std::hex << std::setw(8) << std::setfill('0')
            << static_cast<uint32_t>(rng_());
        id = oss.str();
    } while (agents_.count(id) > 0);
    return id;
}

std::string AgentRegistry::insert(const NeuralConfiguration& config, kernel::NetworkHandle network,
                                  size_t memoryUsage, double spawnTimeMs) {
    auto slot = std::make_shared<AgentSlot>();
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ > 0) --pending_;
        id = generateId();
        const auto now = std::chrono::steady_clock::now();
        slot->agent.id = id;
        slot->agent.config = config;
        slot->agent.state = AgentState::Active;
        slot->agent.createdAt = now;
        slot->agent.lastActive = now;
        slot->agent.memoryUsage = memoryUsage;
        slot->network = network;
        agents_.emplace(id, slot);
        ++totalSpawned_;
    }
    spdlog::info("[Registry] агент {} зарегистрирован ({} байт, {:.2f} мс)", id, memoryUsage, spawnTimeMs);
    events_.notify(events::EventType::AgentSpawned, {
        {"agentId", id},
        {"spawnTime", spawnTimeMs},
        {"config", config.toJson()},
        {"memoryUsage", memoryUsage}
    });
    return id;
}

std::optional<NeuralAgent> AgentRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return std::nullopt;
    return it->second->agent;
}

std::shared_ptr<AgentSlot> AgentRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    return it == agents_.end() ? nullptr : it->second;
}

std::shared_ptr<AgentSlot> AgentRegistry::acquire(const std::string& id) const {
    auto slot = find(id);
    if (!slot) throw NotFoundError(id);
    return slot;
}

std::vector<NeuralAgent> AgentRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NeuralAgent> result;
    result.reserve(agents_.size());
    for (const auto& [id, slot] : agents_) {
        result.push_back(slot->agent);
    }
    std::sort(result.begin(), result.end(),
              [](const NeuralAgent& a, const NeuralAgent& b) { return a.createdAt < b.createdAt; });
    return result;
}

std::vector<NeuralAgent> AgentRegistry::list(AgentState state) const {
    auto result = list();
    result.erase(std::remove_if(result.begin(), result.end(),
                                [state](const NeuralAgent& a) { return a.state != state; }),
                 result.end());
    return result;
}

std::vector<std::string> AgentRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(agents_.size());
    for (const auto& entry : agents_) result.push_back(entry.first);
    return result;
}

size_t AgentRegistry::activeAgents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(agents_.begin(), agents_.end(), [](const auto& entry) {
        return entry.second->agent.state == AgentState::Active;
    }));
}

size_t AgentRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

uint64_t AgentRegistry::totalSpawned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSpawned_;
}

void AgentRegistry::setState(AgentSlot& slot, AgentState to) {
    slot.agent.state = to;
    slot.agent.lastActive = std::chrono::steady_clock::now();
}

AgentState AgentRegistry::transition(const std::string& id, const StateSet& from, AgentState to) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) throw NotFoundError(id);
    AgentSlot& slot = *it->second;
    const AgentState previous = slot.agent.state;
    if (!contains(from, previous)) {
        throw StateConflictError("Agent " + id + " is " + toString(previous) +
                                 ", expected " + describe(from));
    }
    if (slot.terminationRequested && to == AgentState::Learning) {
        throw StateConflictError("Agent " + id + " is scheduled for termination");
    }
    setState(slot, to);
    spdlog::debug("[Registry] {}: {} -> {}", id, toString(previous), toString(to));
    return previous;
}

TerminationTicket AgentRegistry::requestTermination(const std::string& id) {
    TerminationTicket ticket;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        std::promise<void> ready;
        ready.set_value();
        ticket.done = ready.get_future();
        return ticket;
    }
    AgentSlot& slot = *it->second;
    slot.terminationWaiters.emplace_back();
    ticket.done = slot.terminationWaiters.back().get_future();

    switch (slot.agent.state) {
    case AgentState::Active:
    case AgentState::Error:
        if (slot.terminationRequested) {
            // Обучение уже закончилось, отложенное удаление вот-вот заберёт агента
            ticket.status = TerminationStatus::Pending;
            break;
        }
        spdlog::debug("[Registry] {}: {} -> terminating", id, toString(slot.agent.state));
        setState(slot, AgentState::Terminating);
        ticket.status = TerminationStatus::Started;
        break;
    case AgentState::Learning:
        slot.terminationRequested = true;
        ticket.status = TerminationStatus::Deferred;
        spdlog::info("[Registry] {}: удаление отложено до конца обучения", id);
        break;
    default:
        ticket.status = TerminationStatus::Pending;
        break;
    }
    return ticket;
}

bool AgentRegistry::claimDeferredTermination(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return false;
    AgentSlot& slot = *it->second;
    if (!slot.terminationRequested) return false;
    if (slot.agent.state != AgentState::Active && slot.agent.state != AgentState::Error) return false;
    slot.terminationRequested = false;
    setState(slot, AgentState::Terminating);
    spdlog::debug("[Registry] {}: отложенное удаление, -> terminating", id);
    return true;
}

void AgentRegistry::recordInference(const std::string& id, double elapsedMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        spdlog::debug("[Registry] инференс для удалённого агента {} не учтён", id);
        return;
    }
    NeuralAgent& agent = it->second->agent;
    ++agent.totalInferences;
    agent.averageInferenceTime += (elapsedMs - agent.averageInferenceTime) /
                                  static_cast<double>(agent.totalInferences);
    agent.lastActive = std::chrono::steady_clock::now();
}

void AgentRegistry::completeLearning(const std::string& id, double accuracy) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return;
    AgentSlot& slot = *it->second;
    slot.agent.learningProgress = accuracy;
    if (slot.agent.state == AgentState::Learning) {
        setState(slot, AgentState::Active);
    }
}

bool AgentRegistry::markError(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) return false;
    AgentSlot& slot = *it->second;
    if (slot.agent.state != AgentState::Active && slot.agent.state != AgentState::Learning) {
        return false;
    }
    spdlog::error("[Registry] агент {} переведён в состояние error", id);
    setState(slot, AgentState::Error);
    return true;
}

bool AgentRegistry::remove(const std::string& id) {
    std::shared_ptr<AgentSlot> slot;
    std::vector<std::promise<void>> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = agents_.find(id);
        if (it == agents_.end()) return false;
        slot = it->second;
        agents_.erase(it);
        slot->removed = true;
        waiters.swap(slot->terminationWaiters);
    }
    memory_.release(slot->agent.memoryUsage);
    spdlog::info("[Registry] агент {} удалён", id);
    events_.notify(events::EventType::AgentTerminated, {{"agentId", id}});
    for (auto& waiter : waiters) waiter.set_value();
    return true;
}

} // namespace agent
} // namespace core
} // namespace synapse
