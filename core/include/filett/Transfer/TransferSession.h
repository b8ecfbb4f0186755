// TransferSession.h — состояние одной передачи
// Pending → InProgress → Completed | Canceled | Failed

#pragma once

#include "../export.h"
#include "../Types.h"
#include "../Security/KeyDerivation.h"
#include "CancellationSignal.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// TransferSnapshot: то, что видят подписчики прогресса
// ═══════════════════════════════════════════════════════════

struct FTT_API TransferSnapshot {
    std::string transferId;
    double progress = 0.0;          // 0..100
    std::string message;
    bool completed = false;
    bool canceled = false;
    TransferState state = TransferState::Pending;
    std::string error;              // Только для Failed

    bool isTerminal() const { return FileTT::isTerminal(state); }

    /// {"transfer_id", "progress", "message", "completed", "canceled", "state", "error"?}
    std::string toJson() const;
    static std::optional<TransferSnapshot> fromJson(const std::string& json);
};

// ═══════════════════════════════════════════════════════════
// TransferSession
// ═══════════════════════════════════════════════════════════
//
// Все переходы в terminal состояния "липкие": после них recordChunk,
// reportProgress и повторные mark* возвращают false и ничего не меняют.
// Completed невозможен, если отмена уже была запрошена.

class FTT_API TransferSession {
public:
    /// Переход в terminal состояние; вызывается один раз, вне мьютекса сессии
    using TerminalHandler = std::function<void(const std::string& transferId, TransferState state)>;

    explicit TransferSession(std::string transferId);
    ~TransferSession();

    // Запрет копирования
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    const std::string& transferId() const { return m_transferId; }
    std::chrono::system_clock::time_point createdAt() const { return m_createdAt; }

    // ═══════════════════════════════════════════════════════════
    // Прогресс
    // ═══════════════════════════════════════════════════════════

    /// Задать направление и ожидаемый объём (0 = неизвестен)
    /// @return false если сессия уже terminal
    bool begin(TransferDirection direction, uint64_t expectedBytes);

    /// Учесть обработанный chunk; при достижении expectedBytes → Completed.
    /// @return false если сессия terminal или отмена наблюдена (→ Canceled)
    bool recordChunk(uint64_t bytes);

    /// Процентный прогресс (клиент сообщает сам); 100 → Completed.
    /// Прогресс не уменьшается.
    bool reportProgress(double percent, const std::string& message = "");

    bool markCompleted(const std::string& message = "");
    bool markCanceled(const std::string& message = "");
    bool markFailed(const std::string& error);

    TransferState state() const;
    bool isTerminal() const;
    double progress() const;
    std::string message() const;
    uint64_t processedBytes() const;
    uint64_t expectedBytes() const;
    TransferDirection direction() const;

    TransferSnapshot snapshot() const;

    void setTerminalHandler(TerminalHandler handler);

    // ═══════════════════════════════════════════════════════════
    // Отмена
    // ═══════════════════════════════════════════════════════════

    /// Сигнал создаётся при первом обращении и живёт до разрушения сессии
    std::shared_ptr<CancellationSignal> cancellationSignal();

    bool isCancelRequested() const;

    /// Если сигнал установлен: перейти в Canceled.
    /// @return true если сессия в состоянии Canceled
    bool observeCancellation();

    // ═══════════════════════════════════════════════════════════
    // Ключ
    // ═══════════════════════════════════════════════════════════

    /// Прикрепить ключ (один раз, дальше только чтение)
    /// @return false если ключ уже установлен или сессия terminal
    bool attachKey(KeyMaterial material);

    /// nullptr если handshake не проводился
    std::shared_ptr<const KeyMaterial> keyMaterial() const;
    bool hasKey() const;

private:
    bool applyCancelLocked(const std::string& message);
    bool settle(std::unique_lock<std::mutex>& lock, TransferState before, bool result);
    bool cancelRequestedLocked() const;
    std::string verbLocked() const;

    const std::string m_transferId;
    const std::chrono::system_clock::time_point m_createdAt;

    mutable std::mutex m_mutex;
    TransferState m_state = TransferState::Pending;
    TransferDirection m_direction = TransferDirection::Upload;
    double m_progress = 0.0;
    std::string m_message = "Pending";
    std::string m_error;
    uint64_t m_expectedBytes = 0;
    uint64_t m_processedBytes = 0;

    std::shared_ptr<CancellationSignal> m_signal;
    std::shared_ptr<const KeyMaterial> m_key;
    TerminalHandler m_terminalHandler;
};

} // namespace FileTT
