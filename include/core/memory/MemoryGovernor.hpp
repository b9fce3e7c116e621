#pragma once
#include <cstddef>
#include <mutex>
#include <vector>

namespace synapse {
namespace core {
namespace memory {

// MemoryGovernor. Учёт памяти агентов: лимит на агента и общий пул.
// Резервирование делается при spawn, освобождение при удалении агента.
class MemoryGovernor {
public:
    MemoryGovernor(size_t perAgentLimit, size_t aggregateLimit);

    // Оценка объёма сети по архитектуре; монотонна по числу параметров,
    // при переполнении насыщается до SIZE_MAX (такой запрос всегда отклоняется).
    static size_t estimateFootprint(const std::vector<size_t>& architecture);
    static size_t parameterCount(const std::vector<size_t>& architecture); // SIZE_MAX при переполнении

    bool reserve(size_t bytes); // false: превышен лимит агента или пула
    void release(size_t bytes); // Никогда не уходит в минус
    void releaseAll();

    size_t totalReserved() const;
    size_t perAgentLimit() const { return perAgentLimit_; }
    size_t aggregateLimit() const { return aggregateLimit_; }
    double pressure() const; // totalReserved / aggregateLimit, 0..1
private:
    const size_t perAgentLimit_;
    const size_t aggregateLimit_;
    mutable std::mutex mutex_;
    size_t reserved_ = 0;
};

} // namespace memory
} // namespace core
} // namespace synapse
