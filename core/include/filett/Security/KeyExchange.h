// KeyExchange.h — SPAKE2 handshake поверх NIST P-256
// Два сообщения, без I/O: на входе и выходе непрозрачные байты

#pragma once

#include "../export.h"
#include "../Types.h"
#include "Crypto.h"
#include <memory>
#include <string>
#include <vector>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr size_t PAKE_POINT_SIZE = 33;                       // Сжатая точка P-256
constexpr size_t PAKE_MESSAGE_SIZE = 1 + PAKE_POINT_SIZE;    // Байт роли + точка
constexpr size_t PAKE_SECRET_SIZE = 32;

// ═══════════════════════════════════════════════════════════
// KeyExchange: одна сторона SPAKE2
// ═══════════════════════════════════════════════════════════
//
// Сообщение: role ('A' | 'B' | 'S') ‖ compressed(x·G + w·M_role)
// Секрет:    SHA256(SHA256(pw) ‖ SHA256(ctx) ‖ msgA ‖ msgB ‖ K)
//
// Initiator работает только с Responder, Symmetric только с Symmetric.
// Секрет нельзя использовать как ключ шифра напрямую, только через KeyDerivation.

class FTT_API KeyExchange {
public:
    /// @param password Общий пароль (не может быть пустым)
    /// @param context Дополнительная строка привязки (например, TransferId)
    /// @throws std::invalid_argument при пустом пароле
    KeyExchange(PakeRole role, const std::string& password, const std::string& context = "");
    ~KeyExchange();

    // Запрет копирования
    KeyExchange(const KeyExchange&) = delete;
    KeyExchange& operator=(const KeyExchange&) = delete;

    PakeRole role() const;

    /// Сгенерировать эфемерный скаляр и исходящее сообщение.
    /// Каждый вызов даёт новое состояние и новое сообщение.
    std::vector<uint8_t> start();

    /// Принять сообщение пира и вычислить общий секрет.
    /// @throws ProtocolError: до start(), повторный вызов, неверная длина,
    ///         чужая роль, некорректная точка, отражённое сообщение.
    ///         Эфемерное состояние при этом уничтожается.
    SecureBytes finish(const std::vector<uint8_t>& peerMessage);

    bool isStarted() const;
    bool isFinished() const;

    /// Наше сообщение из последнего start() (пусто до start)
    const std::vector<uint8_t>& outboundMessage() const;

    /// Принятое сообщение пира (пусто до успешного finish)
    const std::vector<uint8_t>& peerMessage() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace FileTT
