// Config.h — параметры сервиса передачи файлов
// JSON: toJson() / fromJson() / loadFromFile()

#pragma once

#include "export.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace FileTT {

struct FTT_API ServiceConfig {
    size_t chunkSize = 1024 * 1024;          // 1 MB chunks
    int64_t broadcastIntervalMs = 200;
    int64_t presencePingIntervalSec = 30;
    int64_t presenceTimeoutSec = 90;
    int64_t idleRetentionSec = 60;           // terminal передачи без подписчиков
    bool allowPlaintextFallback = true;
    bool requireKeyConfirmation = true;
    std::string logLevel = "info";

    std::chrono::milliseconds broadcastInterval() const {
        return std::chrono::milliseconds(broadcastIntervalMs);
    }
    std::chrono::seconds presencePingInterval() const {
        return std::chrono::seconds(presencePingIntervalSec);
    }
    std::chrono::seconds presenceTimeout() const {
        return std::chrono::seconds(presenceTimeoutSec);
    }
    std::chrono::seconds idleRetention() const {
        return std::chrono::seconds(idleRetentionSec);
    }

    /// Проверить значения; причина отказа пишется в лог
    bool isValid() const;

    std::string toJson() const;

    /// Отсутствующие поля получают значения по умолчанию
    /// @return nullopt при некорректном JSON или значениях
    static std::optional<ServiceConfig> fromJson(const std::string& json);

    static std::optional<ServiceConfig> loadFromFile(const std::string& path);
};

} // namespace FileTT
