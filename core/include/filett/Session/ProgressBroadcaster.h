// ProgressBroadcaster.h — периодическая рассылка snapshot передачи подписчикам
// Один поток на активную передачу, завершается после terminal snapshot

#pragma once

#include "../export.h"
#include "../Transfer/TransferSession.h"
#include "Subscriber.h"
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace FileTT {

constexpr std::chrono::milliseconds DEFAULT_BROADCAST_INTERVAL{200};

class FTT_API ProgressBroadcaster {
public:
    /// Текущие подписчики (копия, итерируется без блокировок)
    using SubscriberProvider = std::function<std::vector<SubscriberPtr>()>;

    /// Вызывается для подписчика, которому не удалось отправить snapshot
    using DropHandler = std::function<void(const SubscriberPtr&)>;

    ProgressBroadcaster(
        std::shared_ptr<TransferSession> session,
        SubscriberProvider provider,
        DropHandler onDrop,
        std::chrono::milliseconds interval = DEFAULT_BROADCAST_INTERVAL
    );

    /// Останавливает поток
    ~ProgressBroadcaster();

    // Запрет копирования
    ProgressBroadcaster(const ProgressBroadcaster&) = delete;
    ProgressBroadcaster& operator=(const ProgressBroadcaster&) = delete;

    /// Запустить поток (повторный вызов после завершения перезапускает его)
    void start();

    /// Разбудить и дождаться потока. Из собственного потока делается detach.
    void stop();

    bool isRunning() const;

    /// Одна рассылка в текущем потоке
    /// @return true если отправленный snapshot terminal
    bool broadcastOnce();

    /// Сколько раз snapshot был разослан
    uint64_t rounds() const;

private:
    struct State;

    static void runLoop(std::shared_ptr<State> state);
    static bool deliver(State& state);

    std::shared_ptr<State> m_state;
};

} // namespace FileTT
