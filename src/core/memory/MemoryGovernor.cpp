#include "core/memory/MemoryGovernor.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace memory {

namespace {

constexpr size_t kSaturated = std::numeric_limits<size_t>::max();
// Веса, градиенты, скорости момента, активации
constexpr size_t kFootprintMultiplier = 4 * sizeof(float);
constexpr size_t kBaseOverhead = 64 * 1024;

bool mulOverflows(size_t a, size_t b, size_t& out) {
    if (a != 0 && b > kSaturated / a) return true;
    out = a * b;
    return false;
}

bool addOverflows(size_t a, size_t b, size_t& out) {
    if (b > kSaturated - a) return true;
    out = a + b;
    return false;
}

} // namespace

MemoryGovernor::MemoryGovernor(size_t perAgentLimit, size_t aggregateLimit)
    : perAgentLimit_(perAgentLimit), aggregateLimit_(aggregateLimit) {
    spdlog::debug("[Memory] лимиты: {} байт на агента, {} байт всего", perAgentLimit_, aggregateLimit_);
}

size_t MemoryGovernor::parameterCount(const std::vector<size_t>& architecture) {
    size_t total = 0;
    for (size_t i = 0; i + 1 < architecture.size(); ++i) {
        size_t weights = 0;
        if (mulOverflows(architecture[i], architecture[i + 1], weights)) return kSaturated;
        if (addOverflows(total, weights, total)) return kSaturated;
        if (addOverflows(total, architecture[i + 1], total)) return kSaturated;
    }
    return total;
}

size_t MemoryGovernor::estimateFootprint(const std::vector<size_t>& architecture) {
    const size_t params = parameterCount(architecture);
    if (params == kSaturated) return kSaturated;
    size_t bytes = 0;
    if (mulOverflows(params, kFootprintMultiplier, bytes)) return kSaturated;
    if (addOverflows(bytes, kBaseOverhead, bytes)) return kSaturated;
    return bytes;
}

bool MemoryGovernor::reserve(size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bytes > perAgentLimit_) {
        spdlog::warn("[Memory] отказ: {} байт больше лимита агента {}", bytes, perAgentLimit_);
        return false;
    }
    if (bytes > aggregateLimit_ - std::min(reserved_, aggregateLimit_)) {
        spdlog::warn("[Memory] отказ: пул {} из {} байт, запрошено {}", reserved_, aggregateLimit_, bytes);
        return false;
    }
    reserved_ += bytes;
    return true;
}

void MemoryGovernor::release(size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bytes > reserved_) {
        spdlog::warn("[Memory] освобождение {} байт больше зарезервированного {}, обнуляем", bytes, reserved_);
        reserved_ = 0;
        return;
    }
    reserved_ -= bytes;
}

void MemoryGovernor::releaseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_ = 0;
}

size_t MemoryGovernor::totalReserved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_;
}

double MemoryGovernor::pressure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (aggregateLimit_ == 0) return 1.0;
    return std::min(1.0, static_cast<double>(reserved_) / static_cast<double>(aggregateLimit_));
}

} // namespace memory
} // namespace core
} // namespace synapse
