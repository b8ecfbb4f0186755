// SessionRegistry.cpp — реестр передач и presence

#include "filett/Session/SessionRegistry.h"
#include "filett/Security/Crypto.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace FileTT {

namespace {

using Clock = std::chrono::steady_clock;

struct TransferEntry {
    std::mutex mutex;
    std::shared_ptr<TransferSession> session;
    std::vector<SubscriberPtr> subscribers;
    std::unique_ptr<ProgressBroadcaster> broadcaster;
    bool observed = false;                       // Был хотя бы один подписчик
    std::optional<Clock::time_point> terminalSince;
};

using BroadcasterList = std::vector<std::unique_ptr<ProgressBroadcaster>>;

} // namespace

// ═══════════════════════════════════════════════════════════
// Impl
// ═══════════════════════════════════════════════════════════

class SessionRegistry::Impl : public std::enable_shared_from_this<SessionRegistry::Impl> {
public:
    Impl(std::chrono::milliseconds interval, std::chrono::milliseconds retention)
        : m_interval(interval), m_retention(retention) {}

    /// Вызывается из ~SessionRegistry; Impl может пережить реестр в колбэках
    void shutdown() {
        BroadcasterList broadcasters;
        {
            std::lock_guard<std::mutex> lock(m_mapMutex);
            for (auto& [id, entry] : m_entries) {
                std::lock_guard<std::mutex> entryLock(entry->mutex);
                if (entry->broadcaster) {
                    broadcasters.push_back(std::move(entry->broadcaster));
                }
            }
            m_entries.clear();
        }
        // Остановка вне блокировок: поток может ждать мьютекс записи
        stopAll(broadcasters);
    }

    // ═══════════════════════════════════════════════════════════
    // Записи
    // ═══════════════════════════════════════════════════════════

    std::shared_ptr<TransferEntry> getOrCreateEntryLocked(const std::string& transferId, BroadcasterList& toStop) {
        auto it = m_entries.find(transferId);
        if (it != m_entries.end()) {
            return it->second;
        }

        sweepExpiredLocked(Clock::now(), toStop);

        auto entry = std::make_shared<TransferEntry>();
        entry->session = std::make_shared<TransferSession>(transferId);

        std::weak_ptr<Impl> weakSelf = weak_from_this();
        std::weak_ptr<TransferEntry> weakEntry = entry;
        entry->session->setTerminalHandler([weakSelf, weakEntry](const std::string& id, TransferState) {
            auto self = weakSelf.lock();
            auto locked = weakEntry.lock();
            if (self && locked) {
                self->onTerminal(id, locked);
            }
        });

        m_entries.emplace(transferId, entry);
        spdlog::debug("SessionRegistry: created transfer {}", transferId);
        return entry;
    }

    std::shared_ptr<TransferEntry> findEntry(const std::string& transferId) const {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        auto it = m_entries.find(transferId);
        return it != m_entries.end() ? it->second : nullptr;
    }

    /// Под m_mapMutex. Удаляет запись, если нет подписчиков и сессия terminal.
    /// Broadcaster возвращается наружу для остановки вне блокировок.
    bool tryEraseLocked(std::map<std::string, std::shared_ptr<TransferEntry>>::iterator it,
                        BroadcasterList& toStop) {
        auto& entry = it->second;
        {
            std::lock_guard<std::mutex> entryLock(entry->mutex);
            if (!entry->subscribers.empty() || !entry->session->isTerminal()) {
                return false;
            }
            if (entry->broadcaster) {
                toStop.push_back(std::move(entry->broadcaster));
            }
        }
        spdlog::info("SessionRegistry: released transfer {} ({})", it->first,
                     transferStateToString(entry->session->state()));
        m_entries.erase(it);
        return true;
    }

    size_t sweepExpiredLocked(Clock::time_point now, BroadcasterList& toStop) {
        size_t erased = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            auto next = std::next(it);
            bool expired = false;
            {
                std::lock_guard<std::mutex> entryLock(it->second->mutex);
                expired = it->second->terminalSince && now - *it->second->terminalSince >= m_retention;
            }
            if (expired && tryEraseLocked(it, toStop)) {
                erased++;
            }
            it = next;
        }
        return erased;
    }

    /// Удалить запись, если она всё ещё та же и освобождена
    bool release(const std::string& transferId, const std::shared_ptr<TransferEntry>& entry) {
        BroadcasterList toStop;
        bool erased = false;
        {
            std::lock_guard<std::mutex> lock(m_mapMutex);
            auto it = m_entries.find(transferId);
            if (it != m_entries.end() && it->second == entry) {
                erased = tryEraseLocked(it, toStop);
            }
        }
        stopAll(toStop);
        return erased;
    }

    /// Сессия стала terminal. Записи с подписчиками в прошлом освобождаются сразу,
    /// placeholder'ы ждут idleRetention.
    void onTerminal(const std::string& transferId, const std::shared_ptr<TransferEntry>& entry) {
        bool observed = false;
        {
            std::lock_guard<std::mutex> entryLock(entry->mutex);
            entry->terminalSince = Clock::now();
            observed = entry->observed;
        }
        if (observed) {
            release(transferId, entry);
        }
    }

    static void stopAll(BroadcasterList& broadcasters) {
        for (auto& broadcaster : broadcasters) {
            broadcaster->stop();
        }
        broadcasters.clear();
    }

    std::unique_ptr<ProgressBroadcaster> makeBroadcaster(const std::string& transferId,
                                                         const std::shared_ptr<TransferEntry>& entry) {
        std::weak_ptr<TransferEntry> weak = entry;
        std::weak_ptr<Impl> weakSelf = weak_from_this();

        auto provider = [weak]() -> std::vector<SubscriberPtr> {
            auto locked = weak.lock();
            if (!locked) {
                return {};
            }
            std::lock_guard<std::mutex> lock(locked->mutex);
            return locked->subscribers;
        };

        // Выполняется в потоке broadcaster'а; остановка своего потока делает detach
        auto onDrop = [weak, weakSelf, transferId](const SubscriberPtr& subscriber) {
            auto locked = weak.lock();
            if (!locked) {
                return;
            }
            bool removed = false;
            {
                std::lock_guard<std::mutex> lock(locked->mutex);
                auto& subs = locked->subscribers;
                auto it = std::find(subs.begin(), subs.end(), subscriber);
                if (it != subs.end()) {
                    subs.erase(it);
                    removed = true;
                }
            }
            if (!removed) {
                return;
            }
            subscriber->close();
            if (auto self = weakSelf.lock()) {
                self->release(transferId, locked);
            }
        };

        return std::make_unique<ProgressBroadcaster>(entry->session, provider, onDrop, m_interval);
    }

    std::chrono::milliseconds m_interval;
    std::chrono::milliseconds m_retention;

    mutable std::mutex m_mapMutex;
    std::map<std::string, std::shared_ptr<TransferEntry>> m_entries;

    mutable std::mutex m_presenceMutex;
    std::map<std::string, SubscriberPtr> m_presence;
};

// ═══════════════════════════════════════════════════════════
// SessionRegistry: передачи
// ═══════════════════════════════════════════════════════════

SessionRegistry::SessionRegistry(std::chrono::milliseconds broadcastInterval,
                                 std::chrono::milliseconds idleRetention)
    : m_impl(std::make_shared<Impl>(broadcastInterval, idleRetention)) {}

SessionRegistry::SessionRegistry(const ServiceConfig& config)
    : SessionRegistry(config.broadcastInterval(), config.idleRetention()) {}

SessionRegistry::~SessionRegistry() {
    m_impl->shutdown();
}

std::shared_ptr<TransferSession> SessionRegistry::getOrCreate(const std::string& transferId) {
    if (transferId.empty()) {
        throw std::invalid_argument("Transfer id cannot be empty");
    }
    BroadcasterList toStop;
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
        session = m_impl->getOrCreateEntryLocked(transferId, toStop)->session;
    }
    Impl::stopAll(toStop);
    return session;
}

std::shared_ptr<TransferSession> SessionRegistry::find(const std::string& transferId) const {
    auto entry = m_impl->findEntry(transferId);
    return entry ? entry->session : nullptr;
}

std::shared_ptr<TransferSession> SessionRegistry::createTransfer() {
    BroadcasterList toStop;
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
        std::string transferId;
        do {
            transferId = Crypto::generateUUID();
        } while (m_impl->m_entries.count(transferId) > 0);
        session = m_impl->getOrCreateEntryLocked(transferId, toStop)->session;
    }
    Impl::stopAll(toStop);
    return session;
}

bool SessionRegistry::contains(const std::string& transferId) const {
    std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
    return m_impl->m_entries.count(transferId) > 0;
}

size_t SessionRegistry::transferCount() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
    return m_impl->m_entries.size();
}

std::vector<std::string> SessionRegistry::transferIds() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
    std::vector<std::string> ids;
    ids.reserve(m_impl->m_entries.size());
    for (const auto& [id, entry] : m_impl->m_entries) {
        ids.push_back(id);
    }
    return ids;
}

// ═══════════════════════════════════════════════════════════
// SessionRegistry: подписчики прогресса
// ═══════════════════════════════════════════════════════════

std::shared_ptr<TransferSession> SessionRegistry::subscribeProgress(
    const std::string& transferId, SubscriberPtr connection) {
    if (transferId.empty() || !connection) {
        throw std::invalid_argument("subscribeProgress requires a transfer id and a connection");
    }

    BroadcasterList toStop;
    std::shared_ptr<TransferSession> session;
    {
        // Под блокировкой map: параллельное удаление записи невозможно
        std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
        auto entry = m_impl->getOrCreateEntryLocked(transferId, toStop);

        std::lock_guard<std::mutex> entryLock(entry->mutex);
        auto& subs = entry->subscribers;
        if (std::find(subs.begin(), subs.end(), connection) == subs.end()) {
            subs.push_back(connection);
            spdlog::debug("SessionRegistry: {} subscribed to {}", connection->id(), transferId);
        }
        entry->observed = true;

        if (!entry->broadcaster) {
            entry->broadcaster = m_impl->makeBroadcaster(transferId, entry);
        }
        entry->broadcaster->start();
        session = entry->session;
    }
    Impl::stopAll(toStop);
    return session;
}

bool SessionRegistry::unsubscribeProgress(const std::string& transferId, const SubscriberPtr& connection) {
    BroadcasterList toStop;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
        auto it = m_impl->m_entries.find(transferId);
        if (it == m_impl->m_entries.end()) {
            return false;
        }

        {
            std::lock_guard<std::mutex> entryLock(it->second->mutex);
            auto& subs = it->second->subscribers;
            auto subIt = std::find(subs.begin(), subs.end(), connection);
            if (subIt != subs.end()) {
                subs.erase(subIt);
                removed = true;
            }
        }

        if (removed) {
            m_impl->tryEraseLocked(it, toStop);
        }
    }
    Impl::stopAll(toStop);
    return removed;
}

size_t SessionRegistry::subscriberCount(const std::string& transferId) const {
    auto entry = m_impl->findEntry(transferId);
    if (!entry) {
        return 0;
    }
    std::lock_guard<std::mutex> entryLock(entry->mutex);
    return entry->subscribers.size();
}

bool SessionRegistry::releaseTransfer(const std::string& transferId) {
    BroadcasterList toStop;
    bool erased = false;
    {
        std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
        auto it = m_impl->m_entries.find(transferId);
        if (it == m_impl->m_entries.end()) {
            return false;
        }
        erased = m_impl->tryEraseLocked(it, toStop);
    }
    Impl::stopAll(toStop);
    return erased;
}

size_t SessionRegistry::sweepIdle() {
    BroadcasterList toStop;
    size_t erased = 0;
    {
        std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
        for (auto it = m_impl->m_entries.begin(); it != m_impl->m_entries.end();) {
            auto next = std::next(it);
            if (m_impl->tryEraseLocked(it, toStop)) {
                erased++;
            }
            it = next;
        }
    }
    Impl::stopAll(toStop);
    if (erased > 0) {
        spdlog::info("SessionRegistry: swept {} idle transfers", erased);
    }
    return erased;
}

size_t SessionRegistry::sweepExpired(std::chrono::steady_clock::time_point now) {
    BroadcasterList toStop;
    size_t erased = 0;
    {
        std::lock_guard<std::mutex> lock(m_impl->m_mapMutex);
        erased = m_impl->sweepExpiredLocked(now, toStop);
    }
    Impl::stopAll(toStop);
    return erased;
}

bool SessionRegistry::requestCancel(const std::string& transferId) {
    auto session = getOrCreate(transferId);

    bool first = session->cancellationSignal()->requestCancel();
    session->markCanceled();
    if (first) {
        spdlog::info("SessionRegistry: cancel requested for {}", transferId);
    }
    return first;
}

// ═══════════════════════════════════════════════════════════
// SessionRegistry: presence
// ═══════════════════════════════════════════════════════════

PresenceResult SessionRegistry::registerPresence(const std::string& clientId, SubscriberPtr connection) {
    if (clientId.empty() || !connection) {
        return PresenceResult::InvalidArgument;
    }

    std::lock_guard<std::mutex> lock(m_impl->m_presenceMutex);
    if (m_impl->m_presence.count(clientId) > 0) {
        spdlog::warn("SessionRegistry: client {} is already connected", clientId);
        return PresenceResult::AlreadyConnected;
    }
    m_impl->m_presence.emplace(clientId, std::move(connection));
    return PresenceResult::Success;
}

bool SessionRegistry::unregisterPresence(const std::string& clientId, const SubscriberPtr& connection) {
    std::lock_guard<std::mutex> lock(m_impl->m_presenceMutex);
    auto it = m_impl->m_presence.find(clientId);
    if (it == m_impl->m_presence.end() || it->second != connection) {
        return false;
    }
    m_impl->m_presence.erase(it);
    return true;
}

SubscriberPtr SessionRegistry::presenceConnection(const std::string& clientId) const {
    std::lock_guard<std::mutex> lock(m_impl->m_presenceMutex);
    auto it = m_impl->m_presence.find(clientId);
    return it != m_impl->m_presence.end() ? it->second : nullptr;
}

std::vector<std::string> SessionRegistry::presenceSnapshot() const {
    std::lock_guard<std::mutex> lock(m_impl->m_presenceMutex);
    std::vector<std::string> ids;
    ids.reserve(m_impl->m_presence.size());
    for (const auto& [id, connection] : m_impl->m_presence) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::pair<std::string, SubscriberPtr>> SessionRegistry::presenceConnections() const {
    std::lock_guard<std::mutex> lock(m_impl->m_presenceMutex);
    return {m_impl->m_presence.begin(), m_impl->m_presence.end()};
}

} // namespace FileTT
