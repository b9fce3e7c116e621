#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>
#include <type_traits>

// Определение платформо-зависимых макросов
#if defined(__linux__)
    #define SYNAPSE_PLATFORM_LINUX
    #include <pthread.h>
#endif

namespace synapse {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads = 0;    // Активные потоки
    size_t queueSize = 0;        // Размер очереди
    size_t totalThreads = 0;     // Всего потоков
    size_t completedTasks = 0;   // Выполнено задач
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t minThreads = 2;       // Мин. потоки
    size_t maxThreads = 8;       // Макс. потоки
    size_t queueSize = 1024;     // Макс. очередь
    std::string name = "pool";   // Имя (для потоков и логов)

    bool validate() const {
        if (minThreads > maxThreads) return false;
        if (minThreads == 0) return false;
        if (queueSize == 0) return false;
        return true;
    }
};

// Пул потоков
// Стартует с minThreads и добавляет потоки до maxThreads, если все заняты.
// enqueue блокируется, пока очередь заполнена.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Конструктор
    ~ThreadPool(); // Деструктор
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    void enqueue(std::function<void()> task); // Добавить задачу

    // Добавить задачу и получить future с её результатом (или исключением)
    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    size_t getActiveThreadCount() const; // Активные потоки
    size_t getQueueSize() const; // Размер очереди
    bool isQueueEmpty() const; // Очередь пуста?
    void waitForCompletion(); // Ждать завершения
    void stop(); // Остановить пул
    void restart(); // Перезапустить пул
    bool isStopped() const; // Пул остановлен?
    ThreadPoolMetrics getMetrics() const; // Метрики
    void setConfiguration(const ThreadPoolConfig& config); // Установить конфиг
    ThreadPoolConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace thread
} // namespace core
} // namespace synapse
