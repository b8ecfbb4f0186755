// CancellationSignal.h — одноразовый сигнал отмены передачи
// Set-once, несколько наблюдателей, пробуждение через condition_variable

#pragma once

#include "../export.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace FileTT {

class FTT_API CancellationSignal {
public:
    CancellationSignal() = default;

    // Запрет копирования
    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    /// Установить сигнал и разбудить всех ожидающих.
    /// @return true если сигнал установлен этим вызовом
    bool requestCancel();

    bool isCanceled() const { return m_canceled.load(); }

    /// Ждать отмены не дольше timeout
    /// @return true если сигнал установлен
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    std::atomic<bool> m_canceled{false};
};

} // namespace FileTT
