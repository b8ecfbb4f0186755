// PresenceHub.h — ростер подключённых клиентов и рассылка событий
// user_connected, user_disconnected, connected_users, ping, upload_complete

#pragma once

#include "../export.h"
#include "../Config.h"
#include "../Types.h"
#include "SessionRegistry.h"
#include "Subscriber.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr int PRESENCE_PING_INTERVAL_SEC = 30;
constexpr int PRESENCE_TIMEOUT_SEC = 90;

// ═══════════════════════════════════════════════════════════
// PresenceHub
// ═══════════════════════════════════════════════════════════

class FTT_API PresenceHub {
public:
    using Clock = std::chrono::steady_clock;

    /// Ростер хранится в registry
    explicit PresenceHub(
        SessionRegistry& registry,
        std::chrono::seconds pingInterval = std::chrono::seconds(PRESENCE_PING_INTERVAL_SEC),
        std::chrono::seconds timeout = std::chrono::seconds(PRESENCE_TIMEOUT_SEC)
    );
    PresenceHub(SessionRegistry& registry, const ServiceConfig& config);
    ~PresenceHub();

    // Запрет копирования
    PresenceHub(const PresenceHub&) = delete;
    PresenceHub& operator=(const PresenceHub&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Ростер
    // ═══════════════════════════════════════════════════════════

    /// Разослать user_connected остальным, затем отправить новичку connected_users.
    /// Повторное подключение того же clientId отклоняется (AlreadyConnected).
    PresenceResult connect(const std::string& clientId, SubscriberPtr connection);

    /// Разослать user_disconnected оставшимся, затем удалить клиента
    /// @return false если клиент не подключён
    bool disconnect(const std::string& clientId, const std::string& reason = "disconnected");

    std::vector<std::string> connectedClients() const;
    bool isConnected(const std::string& clientId) const;

    // ═══════════════════════════════════════════════════════════
    // Liveness
    // ═══════════════════════════════════════════════════════════

    /// Любое сообщение от клиента (включая ответ на ping)
    void touch(const std::string& clientId, Clock::time_point now = Clock::now());

    /// ping после pingInterval тишины, принудительный disconnect после timeout
    void checkLiveness(Clock::time_point now = Clock::now());

    /// Периодический checkLiveness в отдельном потоке
    void start(std::chrono::milliseconds checkInterval = std::chrono::seconds(1));
    void stop();
    bool isRunning() const;

    // ═══════════════════════════════════════════════════════════
    // События приложения
    // ═══════════════════════════════════════════════════════════

    /// Разослать {"type": type, ...payload} всем клиентам
    /// @param payloadJson JSON объект с дополнительными полями
    /// @return количество получателей
    size_t notify(const std::string& type, const std::string& payloadJson = "{}");

    size_t notifyUploadComplete(const std::string& transferId, const std::string& filename);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace FileTT
