#pragma once

#include <cstdint>
#include <string>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// Состояние передачи
// ═══════════════════════════════════════════════════════════

enum class TransferState : int32_t {
    Pending = 0,      // Создана, ни одного chunk ещё не обработано
    InProgress = 1,   // Идёт обработка chunks
    Completed = 2,    // Все байты обработаны
    Canceled = 3,     // Наблюдалась отмена
    Failed = 4        // Ошибка I/O или криптографии
};

const char* transferStateToString(TransferState state);
TransferState transferStateFromString(const std::string& str);

/// Terminal состояния "липкие": после них chunks не принимаются
inline bool isTerminal(TransferState state) {
    return state == TransferState::Completed ||
           state == TransferState::Canceled ||
           state == TransferState::Failed;
}

enum class TransferDirection : int32_t {
    Upload = 0,      // Клиент → сервер, chunks пишутся в sink
    Download = 1     // Сервер → клиент, chunks читаются из source
};

const char* transferDirectionToString(TransferDirection direction);

// ═══════════════════════════════════════════════════════════
// Роль в PAKE (SPAKE2)
// A/B и S несовместимы между собой
// ═══════════════════════════════════════════════════════════

enum class PakeRole : int32_t {
    Initiator = 0,   // Сторона A
    Responder = 1,   // Сторона B
    Symmetric = 2    // Сторона S (ad hoc пара без фиксированных ролей)
};

const char* pakeRoleToString(PakeRole role);
PakeRole pakeRoleFromString(const std::string& str);

/// Байт роли в сообщении handshake ('A', 'B', 'S')
uint8_t pakeRoleTag(PakeRole role);

/// Роль, которую обязан иметь пир
PakeRole pakePeerRole(PakeRole role);

// ═══════════════════════════════════════════════════════════
// Режим ChunkCodec
// ═══════════════════════════════════════════════════════════

enum class CodecMode : int32_t {
    Encrypted = 0,   // AES-256-GCM, frame = nonce ‖ tag ‖ ciphertext
    Plaintext = 1    // Ключ не установлен: байты передаются как есть
};

const char* codecModeToString(CodecMode mode);

enum class NonceMode : int32_t {
    Random = 0,      // 12 случайных байт на chunk
    Counter = 1      // 4 байта случайного префикса + 64-битный счётчик
};

// ═══════════════════════════════════════════════════════════
// Результат регистрации presence соединения
// ═══════════════════════════════════════════════════════════

enum class PresenceResult {
    Success = 0,
    AlreadyConnected = 1,
    InvalidArgument = 2
};

const char* presenceResultToString(PresenceResult result);

} // namespace FileTT
