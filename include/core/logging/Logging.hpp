#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace synapse {
namespace core {
namespace logging {

// Параметры логирования сервиса
struct LoggingConfig {
    std::string level = "info";          // trace | debug | info | warn | error | critical | off
    std::string logPath;                 // Пусто: без файла
    size_t maxLogSize = 5 * 1024 * 1024; // Байт на файл
    size_t maxLogFiles = 3;
    bool console = true;

    bool validate() const {
        if (!logPath.empty() && (maxLogSize == 0 || maxLogFiles == 0)) return false;
        return true;
    }

    nlohmann::json toJson() const;
    static LoggingConfig fromJson(const nlohmann::json& j);
};

// Уровень по имени; неизвестное имя -> info
spdlog::level::level_enum parseLevel(const std::string& name);

// Настройка глобального логгера spdlog (консоль + опционально ротируемый файл).
// Возвращает false, если sink создать не удалось; прежний логгер остаётся.
bool initializeLogging(const LoggingConfig& config, const std::string& loggerName = "synapse");

} // namespace logging
} // namespace core
} // namespace synapse
