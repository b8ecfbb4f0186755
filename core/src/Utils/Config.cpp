#include "filett/Config.h"
#include "filett/Logging.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace FileTT {

bool ServiceConfig::isValid() const {
    if (chunkSize == 0) {
        spdlog::error("ServiceConfig: chunk_size must be positive");
        return false;
    }
    if (broadcastIntervalMs <= 0) {
        spdlog::error("ServiceConfig: broadcast_interval_ms must be positive");
        return false;
    }
    if (presencePingIntervalSec <= 0 || presenceTimeoutSec <= presencePingIntervalSec) {
        spdlog::error("ServiceConfig: presence timeout ({}s) must exceed ping interval ({}s)",
                      presenceTimeoutSec, presencePingIntervalSec);
        return false;
    }
    if (idleRetentionSec < 0) {
        spdlog::error("ServiceConfig: idle_retention_sec must not be negative");
        return false;
    }
    if (!parseLogLevel(logLevel)) {
        spdlog::error("ServiceConfig: unknown log_level '{}'", logLevel);
        return false;
    }
    return true;
}

std::string ServiceConfig::toJson() const {
    json j = {
        {"chunk_size", chunkSize},
        {"broadcast_interval_ms", broadcastIntervalMs},
        {"presence_ping_interval_sec", presencePingIntervalSec},
        {"presence_timeout_sec", presenceTimeoutSec},
        {"idle_retention_sec", idleRetentionSec},
        {"allow_plaintext_fallback", allowPlaintextFallback},
        {"require_key_confirmation", requireKeyConfirmation},
        {"log_level", logLevel}
    };
    return j.dump(2);
}

std::optional<ServiceConfig> ServiceConfig::fromJson(const std::string& jsonStr) {
    ServiceConfig config;
    try {
        auto j = json::parse(jsonStr);
        if (!j.is_object()) {
            spdlog::error("ServiceConfig: configuration must be a JSON object");
            return std::nullopt;
        }
        // Отрицательный chunk_size не должен превратиться в огромный size_t
        int64_t chunkSize = j.value("chunk_size", static_cast<int64_t>(config.chunkSize));
        if (chunkSize <= 0) {
            spdlog::error("ServiceConfig: chunk_size must be positive, got {}", chunkSize);
            return std::nullopt;
        }
        config.chunkSize = static_cast<size_t>(chunkSize);
        config.broadcastIntervalMs = j.value("broadcast_interval_ms", config.broadcastIntervalMs);
        config.presencePingIntervalSec = j.value("presence_ping_interval_sec", config.presencePingIntervalSec);
        config.presenceTimeoutSec = j.value("presence_timeout_sec", config.presenceTimeoutSec);
        config.idleRetentionSec = j.value("idle_retention_sec", config.idleRetentionSec);
        config.allowPlaintextFallback = j.value("allow_plaintext_fallback", config.allowPlaintextFallback);
        config.requireKeyConfirmation = j.value("require_key_confirmation", config.requireKeyConfirmation);
        config.logLevel = j.value("log_level", config.logLevel);
    } catch (const json::exception& e) {
        spdlog::error("ServiceConfig: invalid JSON: {}", e.what());
        return std::nullopt;
    }

    if (!config.isValid()) {
        return std::nullopt;
    }
    return config;
}

std::optional<ServiceConfig> ServiceConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("ServiceConfig: cannot open {}", path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

} // namespace FileTT
