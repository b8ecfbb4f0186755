// Handshake.h — PAKE + KeyDerivation + key confirmation для одной передачи
// Не зависит от транспорта: байты передаёт вызывающий код

#pragma once

#include "../export.h"
#include "../Types.h"
#include "KeyDerivation.h"
#include "KeyExchange.h"
#include <memory>
#include <string>
#include <vector>

namespace FileTT {

enum class HandshakeSide {
    Server,   // Выдаёт salt и первым отправляет confirm
    Client
};

enum class HandshakeState {
    Idle,
    AwaitingPeerMessage,    // start() выполнен
    AwaitingKeyParams,      // Клиент: секрет есть, ждём salt + confirm сервера
    AwaitingConfirmation,   // Сервер: key params отправлены, ждём confirm клиента
    Established,
    Failed
};

FTT_API const char* handshakeStateToString(HandshakeState state);

/// Параметры деривации, которые сервер отправляет клиенту
struct FTT_API KeyParams {
    std::vector<uint8_t> salt;
    std::string label = LABEL_FILE_ENCRYPTION;
    std::vector<uint8_t> confirm;
};

// ═══════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════
//
// Сервер:  start → acceptPeerMessage → verifyPeerConfirmation
// Клиент:  start → receivePeerMessage → acceptKeyParams
//
// Вызов не по порядку бросает ProtocolError. Любая ошибка стирает
// частичное состояние и переводит handshake в Failed.

class FTT_API Handshake {
public:
    /// @param symmetric true → обе стороны в роли S, иначе сервер B, клиент A
    /// @param requireConfirmation false → сервер считает ключ установленным сразу после key params
    Handshake(HandshakeSide side, const std::string& password, const std::string& context = "",
              bool symmetric = false, bool requireConfirmation = true);
    ~Handshake();

    // Запрет копирования
    Handshake(const Handshake&) = delete;
    Handshake& operator=(const Handshake&) = delete;

    HandshakeSide side() const;
    PakeRole role() const;
    HandshakeState state() const;
    bool isEstablished() const { return state() == HandshakeState::Established; }

    /// Исходящее PAKE сообщение
    std::vector<uint8_t> start();

    // ═══════════════════════════════════════════════════════════
    // Сервер
    // ═══════════════════════════════════════════════════════════

    /// Принять PAKE сообщение клиента, сгенерировать salt и свой confirm
    KeyParams acceptPeerMessage(const std::vector<uint8_t>& peerMessage);

    /// @throws AuthenticationError при несовпадении
    void verifyPeerConfirmation(const std::vector<uint8_t>& confirm);

    // ═══════════════════════════════════════════════════════════
    // Клиент
    // ═══════════════════════════════════════════════════════════

    void receivePeerMessage(const std::vector<uint8_t>& peerMessage);

    /// Проверить confirm сервера и вернуть свой
    /// @throws AuthenticationError при несовпадении
    std::vector<uint8_t> acceptKeyParams(const KeyParams& params);

    // ═══════════════════════════════════════════════════════════
    // Результат
    // ═══════════════════════════════════════════════════════════

    /// Забрать ключевой материал (один раз, только в Established)
    /// @throws ProtocolError иначе
    KeyMaterial takeKeyMaterial();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace FileTT
