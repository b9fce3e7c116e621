#include "core/thread/ThreadPool.hpp"
#include <deque>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace thread {

struct ThreadPool::Impl {
    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::deque<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable taskAvailable; // Появилась задача или стоп
    std::condition_variable spaceAvailable; // Освободилось место в очереди
    std::condition_variable allDone; // Очередь пуста и нет активных задач
    size_t activeTasks = 0;
    size_t idleWorkers = 0;
    size_t completedTasks = 0;
    bool stopping = false;

    explicit Impl(const ThreadPoolConfig& cfg) : config(cfg) {}

    // Вызывается под mutex
    void spawnWorker() {
        const size_t index = workers.size();
        workers.emplace_back([this, index]() { workerLoop(index); });
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = false;
        for (size_t i = 0; i < config.minThreads; ++i) {
            spawnWorker();
        }
        spdlog::debug("ThreadPool[{}]: запущено {} потоков (max {})",
                      config.name, config.minThreads, config.maxThreads);
    }

    void workerLoop(size_t index) {
#ifdef SYNAPSE_PLATFORM_LINUX
        // Имя потока ограничено 15 символами
        std::string threadName = (config.name + "-" + std::to_string(index)).substr(0, 15);
        pthread_setname_np(pthread_self(), threadName.c_str());
#endif
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                ++idleWorkers;
                taskAvailable.wait(lock, [this]() { return stopping || !tasks.empty(); });
                --idleWorkers;
                if (tasks.empty()) {
                    // stopping и очередь исчерпана
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop_front();
                ++activeTasks;
                spaceAvailable.notify_one();
            }

            try {
                task();
            } catch (const std::exception& e) {
                // submit() кладёт исключения в future, сюда попадают только задачи enqueue()
                spdlog::error("ThreadPool[{}]: задача завершилась исключением: {}", config.name, e.what());
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                --activeTasks;
                ++completedTasks;
                if (tasks.empty() && activeTasks == 0) {
                    allDone.notify_all();
                }
            }
        }
    }

    void join() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            stopping = true;
        }
        taskAvailable.notify_all();
        spaceAvailable.notify_all();
        for (auto& worker : workers) {
            if (worker.joinable()) worker.join();
        }
        workers.clear();
    }
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("ThreadPool: некорректная конфигурация");
    }
    pImpl = std::make_unique<Impl>(config);
    pImpl->start();
}

ThreadPool::~ThreadPool() {
    try {
        stop();
    } catch (const std::exception& e) {
        spdlog::error("ThreadPool: ошибка при уничтожении: {}", e.what());
    }
}

void ThreadPool::enqueue(std::function<void()> task) {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->spaceAvailable.wait(lock, [this]() {
        return pImpl->stopping || pImpl->tasks.size() < pImpl->config.queueSize;
    });
    if (pImpl->stopping) {
        throw std::runtime_error("ThreadPool[" + pImpl->config.name + "]: пул остановлен");
    }
    pImpl->tasks.push_back(std::move(task));
    // Свободных потоков меньше, чем задач в очереди: расширяемся до maxThreads
    if (pImpl->tasks.size() > pImpl->idleWorkers && pImpl->workers.size() < pImpl->config.maxThreads) {
        pImpl->spawnWorker();
        spdlog::debug("ThreadPool[{}]: добавлен поток, всего {}", pImpl->config.name, pImpl->workers.size());
    }
    pImpl->taskAvailable.notify_one();
}

size_t ThreadPool::getActiveThreadCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->activeTasks;
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.empty();
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->allDone.wait(lock, [this]() {
        return pImpl->tasks.empty() && pImpl->activeTasks == 0;
    });
}

void ThreadPool::stop() {
    if (!pImpl) return;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping && pImpl->workers.empty()) return;
    }
    // Оставшиеся задачи дорабатываются до выхода потоков
    pImpl->join();
    spdlog::debug("ThreadPool[{}]: остановлен", pImpl->config.name);
}

void ThreadPool::restart() {
    stop();
    pImpl->start();
}

bool ThreadPool::isStopped() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->stopping;
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeTasks;
    metrics.queueSize = pImpl->tasks.size();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks;
    return metrics;
}

void ThreadPool::setConfiguration(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("ThreadPool: некорректная конфигурация");
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    // Уже запущенные потоки не сокращаются, новые лимиты действуют на расширение
    pImpl->config = config;
    spdlog::debug("ThreadPool[{}]: конфигурация обновлена: min={}, max={}, queue={}",
                  config.name, config.minThreads, config.maxThreads, config.queueSize);
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace synapse
