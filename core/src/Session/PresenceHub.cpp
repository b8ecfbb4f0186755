// PresenceHub.cpp — presence канал

#include "filett/Session/PresenceHub.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

namespace FileTT {

namespace {

struct Activity {
    PresenceHub::Clock::time_point lastSeen;
    PresenceHub::Clock::time_point lastPing;
};

} // namespace

// ═══════════════════════════════════════════════════════════
// Impl
// ═══════════════════════════════════════════════════════════

class PresenceHub::Impl {
public:
    Impl(SessionRegistry& registry, std::chrono::seconds pingInterval, std::chrono::seconds timeout)
        : m_registry(registry)
        , m_pingInterval(pingInterval)
        , m_timeout(timeout) {
        if (m_timeout <= m_pingInterval) {
            throw std::invalid_argument("Presence timeout must exceed the ping interval");
        }
    }

    ~Impl() {
        stop();
    }

    // ═══════════════════════════════════════════════════════════
    // Рассылка
    // ═══════════════════════════════════════════════════════════

    /// Отправить всем, кроме exclude. Неудачные отправки собираются в failed.
    size_t broadcast(const std::string& message, const std::string& exclude,
                     std::vector<std::string>& failed) {
        size_t delivered = 0;
        for (const auto& [clientId, connection] : m_registry.presenceConnections()) {
            if (clientId == exclude) continue;
            if (sendTo(clientId, connection, message)) {
                delivered++;
            } else {
                failed.push_back(clientId);
            }
        }
        return delivered;
    }

    bool sendTo(const std::string& clientId, const SubscriberPtr& connection, const std::string& message) {
        try {
            if (connection->send(message)) {
                return true;
            }
        } catch (const std::exception& e) {
            spdlog::warn("PresenceHub: send to {} threw: {}", clientId, e.what());
        }
        spdlog::warn("PresenceHub: failed to reach {}", clientId);
        return false;
    }

    /// Недоступные клиенты отключаются после завершения рассылки
    void dropFailed(const std::vector<std::string>& failed) {
        for (const auto& clientId : failed) {
            disconnect(clientId, "connection_lost");
        }
    }

    PresenceResult connect(const std::string& clientId, SubscriberPtr connection) {
        auto result = m_registry.registerPresence(clientId, connection);
        if (result != PresenceResult::Success) {
            spdlog::warn("PresenceHub: rejected {}: {}", clientId, presenceResultToString(result));
            return result;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto now = Clock::now();
            m_activity[clientId] = Activity{now, now};
        }
        spdlog::info("PresenceHub: {} connected", clientId);

        std::vector<std::string> failed;
        json connected = {{"type", "user_connected"}, {"client_id", clientId}};
        broadcast(connected.dump(), clientId, failed);

        json roster = {{"type", "connected_users"}, {"users", m_registry.presenceSnapshot()}};
        if (!sendTo(clientId, connection, roster.dump())) {
            failed.push_back(clientId);
        }

        dropFailed(failed);
        return PresenceResult::Success;
    }

    bool disconnect(const std::string& clientId, const std::string& reason) {
        auto connection = m_registry.presenceConnection(clientId);
        if (!connection) {
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            // Параллельный disconnect того же клиента
            if (m_activity.erase(clientId) == 0) {
                return false;
            }
        }

        std::vector<std::string> failed;
        json event = {{"type", "user_disconnected"}, {"client_id", clientId}, {"reason", reason}};
        broadcast(event.dump(), clientId, failed);

        m_registry.unregisterPresence(clientId, connection);
        connection->close();
        spdlog::info("PresenceHub: {} disconnected ({})", clientId, reason);

        dropFailed(failed);
        return true;
    }

    void touch(const std::string& clientId, Clock::time_point now) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_activity.find(clientId);
        if (it != m_activity.end()) {
            it->second.lastSeen = now;
        }
    }

    void checkLiveness(Clock::time_point now) {
        std::vector<std::string> toPing;
        std::vector<std::string> toDrop;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto& [clientId, activity] : m_activity) {
                auto idle = now - activity.lastSeen;
                if (idle >= m_timeout) {
                    toDrop.push_back(clientId);
                } else if (idle >= m_pingInterval && now - activity.lastPing >= m_pingInterval) {
                    activity.lastPing = now;
                    toPing.push_back(clientId);
                }
            }
        }

        const std::string ping = json{{"type", "ping"}}.dump();
        for (const auto& clientId : toPing) {
            auto connection = m_registry.presenceConnection(clientId);
            if (connection && !sendTo(clientId, connection, ping)) {
                toDrop.push_back(clientId);
            }
        }

        for (const auto& clientId : toDrop) {
            spdlog::warn("PresenceHub: {} timed out", clientId);
            disconnect(clientId, "timeout");
        }
    }

    size_t notify(const std::string& type, const std::string& payloadJson) {
        json message;
        try {
            message = json::parse(payloadJson);
        } catch (const json::exception& e) {
            throw std::invalid_argument(std::string("Invalid presence payload: ") + e.what());
        }
        if (!message.is_object()) {
            throw std::invalid_argument("Presence payload must be a JSON object");
        }
        message["type"] = type;

        std::vector<std::string> failed;
        size_t delivered = broadcast(message.dump(), "", failed);
        dropFailed(failed);
        return delivered;
    }

    // ═══════════════════════════════════════════════════════════
    // Поток liveness
    // ═══════════════════════════════════════════════════════════

    void start(std::chrono::milliseconds checkInterval) {
        std::lock_guard<std::mutex> lock(m_workerMutex);
        if (m_running) {
            return;
        }
        m_running = true;
        m_worker = std::thread([this, checkInterval]() { workerLoop(checkInterval); });
        spdlog::info("PresenceHub: liveness worker started");
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_workerMutex);
            if (!m_running) {
                return;
            }
            m_running = false;
        }
        m_workerCv.notify_all();

        if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id()) {
            m_worker.join();
        } else if (m_worker.joinable()) {
            m_worker.detach();
        }
    }

    void workerLoop(std::chrono::milliseconds checkInterval) {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(m_workerMutex);
                m_workerCv.wait_for(lock, checkInterval, [this] { return !m_running; });
                if (!m_running) break;
            }
            checkLiveness(Clock::now());
        }
    }

    SessionRegistry& m_registry;
    std::chrono::seconds m_pingInterval;
    std::chrono::seconds m_timeout;

    mutable std::mutex m_mutex;
    std::map<std::string, Activity> m_activity;

    std::mutex m_workerMutex;
    std::condition_variable m_workerCv;
    bool m_running = false;
    std::thread m_worker;
};

// ═══════════════════════════════════════════════════════════
// PresenceHub
// ═══════════════════════════════════════════════════════════

PresenceHub::PresenceHub(SessionRegistry& registry, std::chrono::seconds pingInterval,
                         std::chrono::seconds timeout)
    : m_impl(std::make_unique<Impl>(registry, pingInterval, timeout)) {}

PresenceHub::PresenceHub(SessionRegistry& registry, const ServiceConfig& config)
    : PresenceHub(registry, config.presencePingInterval(), config.presenceTimeout()) {}

PresenceHub::~PresenceHub() = default;

PresenceResult PresenceHub::connect(const std::string& clientId, SubscriberPtr connection) {
    return m_impl->connect(clientId, std::move(connection));
}

bool PresenceHub::disconnect(const std::string& clientId, const std::string& reason) {
    return m_impl->disconnect(clientId, reason);
}

std::vector<std::string> PresenceHub::connectedClients() const {
    return m_impl->m_registry.presenceSnapshot();
}

bool PresenceHub::isConnected(const std::string& clientId) const {
    return m_impl->m_registry.presenceConnection(clientId) != nullptr;
}

void PresenceHub::touch(const std::string& clientId, Clock::time_point now) {
    m_impl->touch(clientId, now);
}

void PresenceHub::checkLiveness(Clock::time_point now) {
    m_impl->checkLiveness(now);
}

void PresenceHub::start(std::chrono::milliseconds checkInterval) {
    m_impl->start(checkInterval);
}

void PresenceHub::stop() {
    m_impl->stop();
}

bool PresenceHub::isRunning() const {
    std::lock_guard<std::mutex> lock(m_impl->m_workerMutex);
    return m_impl->m_running;
}

size_t PresenceHub::notify(const std::string& type, const std::string& payloadJson) {
    return m_impl->notify(type, payloadJson);
}

size_t PresenceHub::notifyUploadComplete(const std::string& transferId, const std::string& filename) {
    json payload = {{"transfer_id", transferId}, {"filename", filename}};
    return m_impl->notify("upload_complete", payload.dump());
}

} // namespace FileTT
