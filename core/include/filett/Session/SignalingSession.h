// SignalingSession.h — серверная сторона сигнального канала одной передачи
// JSON: handshake → key_params → confirm → прогресс, cancel, upload_chunk

#pragma once

#include "../export.h"
#include "../Config.h"
#include "../Security/Handshake.h"
#include "../Transfer/TransferSession.h"
#include "SessionRegistry.h"
#include "Subscriber.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace FileTT {

struct FTT_API SignalingOptions {
    bool symmetric = false;             // PAKE в роли S на обеих сторонах
    bool requireKeyConfirmation = true;
    bool allowPlaintextFallback = true; // upload_chunk до начала handshake

    static SignalingOptions fromConfig(const ServiceConfig& config, bool symmetric = false);
};

class FTT_API SignalingSession {
public:
    /// Расшифрованный chunk для приёмника (файл и т.п.)
    /// @throws TransportError при ошибке записи
    using ChunkHandler = std::function<void(const std::string& filename, const std::vector<uint8_t>& data)>;

    /// Передача завершена (progress достиг 100)
    using CompletionHandler = std::function<void(const std::string& transferId, const std::string& filename)>;

    /// @param channel Соединение с клиентом
    /// @param password Общий пароль PAKE; TransferId используется как контекст
    SignalingSession(SessionRegistry& registry, const std::string& transferId, SubscriberPtr channel,
                     const std::string& password, SignalingOptions options = {});
    ~SignalingSession();

    // Запрет копирования
    SignalingSession(const SignalingSession&) = delete;
    SignalingSession& operator=(const SignalingSession&) = delete;

    void setChunkHandler(ChunkHandler handler);
    void setCompletionHandler(CompletionHandler handler);

    /// Отправить клиенту {"type":"handshake","spake2_msg":...}
    /// @return false если канал не принял сообщение
    bool open();

    /// Обработать одно сообщение клиента. Не бросает исключений:
    /// ошибки уходят клиенту как {"type":"error","code","message"}.
    void handleMessage(const std::string& message);

    /// Отписать канал от прогресса
    void close();

    const std::string& transferId() const;
    std::shared_ptr<TransferSession> session() const;
    HandshakeState handshakeState() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace FileTT
