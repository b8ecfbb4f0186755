// SessionRegistry.h — единый реестр передач и presence соединений
// TransferId → {TransferSession, подписчики прогресса, ProgressBroadcaster}

#pragma once

#include "../export.h"
#include "../Config.h"
#include "../Types.h"
#include "../Transfer/TransferSession.h"
#include "ProgressBroadcaster.h"
#include "Subscriber.h"
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// SessionRegistry
// ═══════════════════════════════════════════════════════════
//
// Мьютекс реестра защищает только map, у каждой записи свой мьютекс.
// Запись удаляется целиком (сессия, сигнал отмены, ключ, broadcaster),
// когда у неё нет подписчиков И сессия terminal. Проверка выполняется при
// отписке, при сбросе подписчика broadcaster'ом и при переходе сессии в terminal.
// Записи без подписчиков (placeholder отмены, передачи без наблюдателей)
// живут ещё idleRetention после перехода в terminal.

constexpr std::chrono::milliseconds DEFAULT_IDLE_RETENTION{60 * 1000};

class FTT_API SessionRegistry {
public:
    explicit SessionRegistry(std::chrono::milliseconds broadcastInterval = DEFAULT_BROADCAST_INTERVAL,
                             std::chrono::milliseconds idleRetention = DEFAULT_IDLE_RETENTION);
    explicit SessionRegistry(const ServiceConfig& config);
    ~SessionRegistry();

    // Запрет копирования
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // ═══════════════════════════════════════════════════════════
    // Передачи
    // ═══════════════════════════════════════════════════════════

    /// Первый вызов создаёт сессию в Pending; при гонке побеждает первый
    std::shared_ptr<TransferSession> getOrCreate(const std::string& transferId);

    /// nullptr если передача неизвестна
    std::shared_ptr<TransferSession> find(const std::string& transferId) const;

    /// Новая передача с серверным UUID
    std::shared_ptr<TransferSession> createTransfer();

    bool contains(const std::string& transferId) const;
    size_t transferCount() const;
    std::vector<std::string> transferIds() const;

    // ═══════════════════════════════════════════════════════════
    // Подписчики прогресса
    // ═══════════════════════════════════════════════════════════

    /// Добавить подписчика и запустить broadcaster передачи
    /// @return сессия, к которой подписались
    std::shared_ptr<TransferSession> subscribeProgress(const std::string& transferId, SubscriberPtr connection);

    /// Удалить подписчика; пустой набор + terminal сессия → запись удаляется
    /// @return false если подписчик не найден
    bool unsubscribeProgress(const std::string& transferId, const SubscriberPtr& connection);

    size_t subscriberCount(const std::string& transferId) const;

    /// Попытаться удалить запись (нет подписчиков и сессия terminal)
    /// @return true если запись удалена
    bool releaseTransfer(const std::string& transferId);

    /// Удалить все такие записи
    /// @return количество удалённых
    size_t sweepIdle();

    /// Удалить записи без подписчиков, terminal дольше idleRetention.
    /// Вызывается и автоматически при создании новой записи.
    size_t sweepExpired(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /// Идемпотентно. Неизвестный ID получает placeholder-сессию,
    /// чтобы отмена до старта передачи всё равно сработала.
    /// @return true если отмена установлена этим вызовом
    bool requestCancel(const std::string& transferId);

    // ═══════════════════════════════════════════════════════════
    // Presence
    // ═══════════════════════════════════════════════════════════

    /// Не более одного соединения на clientId
    PresenceResult registerPresence(const std::string& clientId, SubscriberPtr connection);

    /// Удаляет только если зарегистрировано именно это соединение
    bool unregisterPresence(const std::string& clientId, const SubscriberPtr& connection);

    /// nullptr если клиент не подключён
    SubscriberPtr presenceConnection(const std::string& clientId) const;

    /// Отсортированный список clientId
    std::vector<std::string> presenceSnapshot() const;

    /// Копия ростера для рассылки вне блокировок
    std::vector<std::pair<std::string, SubscriberPtr>> presenceConnections() const;

private:
    class Impl;
    // Колбэки сессий и broadcaster'ов держат weak_ptr на Impl
    std::shared_ptr<Impl> m_impl;
};

} // namespace FileTT
