// Errors.h — Таксономия ошибок fileTT
// Криптография и протокол бросают исключения, остальное через bool/optional

#pragma once

#include "export.h"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace FileTT {

enum class ErrorCode : int32_t {
    Protocol = 1,          // Некорректное или неупорядоченное сообщение handshake
    Authentication = 2,    // Несовпадение confirm или ошибка тега AEAD
    ResourceNotFound = 3,  // Неизвестный TransferId или файл
    Transport = 4,         // Ошибка I/O источника/приёмника байт
    Internal = 99
};

FTT_API const char* errorCodeToString(ErrorCode code);

/// Базовое исключение fileTT
class FTT_API TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

/// Handshake прерван, ключ не установлен
class FTT_API ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& message)
        : TransferError(ErrorCode::Protocol, message) {}
};

/// Аутентификация не прошла: передача прерывается
class FTT_API AuthenticationError : public TransferError {
public:
    explicit AuthenticationError(const std::string& message)
        : TransferError(ErrorCode::Authentication, message) {}
};

class FTT_API ResourceNotFound : public TransferError {
public:
    explicit ResourceNotFound(const std::string& message)
        : TransferError(ErrorCode::ResourceNotFound, message) {}
};

/// Ошибка ByteSource/ByteSink, сессия переходит в Failed
class FTT_API TransportError : public TransferError {
public:
    explicit TransportError(const std::string& message)
        : TransferError(ErrorCode::Transport, message) {}
};

} // namespace FileTT
