// KeyDerivation.h — HKDF-SHA256 расширение общего секрета в ключи по назначению
// Key confirmation: confirm_A / confirm_B / confirm_S

#pragma once

#include "../export.h"
#include "../Types.h"
#include "Crypto.h"
#include <string>
#include <vector>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr size_t KDF_SALT_SIZE = 16;
constexpr size_t TRANSPORT_KEY_SIZE = 32;
constexpr size_t CONFIRMATION_SIZE = 32;

constexpr const char* LABEL_FILE_ENCRYPTION = "file_encryption";
constexpr const char* LABEL_CONFIRM_A = "confirm_A";
constexpr const char* LABEL_CONFIRM_B = "confirm_B";
constexpr const char* LABEL_CONFIRM_S = "confirm_S";

/// Метка confirm для роли
FTT_API const char* confirmationLabel(PakeRole role);

// ═══════════════════════════════════════════════════════════
// Результаты деривации
// ═══════════════════════════════════════════════════════════

struct FTT_API DerivedKey {
    std::vector<uint8_t> salt;   // Не секрет, передаётся пиру
    SecureBytes key;
};

/// Ключевой материал одной передачи. Не логируется и не пишется на диск.
struct FTT_API KeyMaterial {
    SecureBytes rawSecret;
    SecureBytes transportKey;               // 32 байта, для ChunkCodec
    SecureBytes confirmation;               // Наш confirm
    SecureBytes expectedPeerConfirmation;   // Ожидаемый confirm пира
    std::vector<uint8_t> salt;              // 16 байт

    void wipe();
};

// ═══════════════════════════════════════════════════════════
// KeyDerivation
// ═══════════════════════════════════════════════════════════

namespace KeyDerivation {

/// Расширение со свежей случайной солью (16 байт).
/// Два вызова с одним секретом и меткой дают разные ключи.
FTT_API DerivedKey expand(const SecureBytes& secret, const std::string& label, size_t length);

/// Детерминированное расширение с известной солью (сторона, получившая salt)
FTT_API SecureBytes expandWithSalt(
    const SecureBytes& secret,
    const std::string& label,
    const std::vector<uint8_t>& salt,
    size_t length
);

/// Собрать KeyMaterial для роли.
/// Для Symmetric в info confirm добавляется сообщение handshake отправителя,
/// чтобы отражённый confirm не прошёл проверку.
/// @param localMessage Наше сообщение KeyExchange (нужно только для Symmetric)
/// @param peerMessage Сообщение пира (нужно только для Symmetric)
FTT_API KeyMaterial deriveSessionKeys(
    const SecureBytes& secret,
    PakeRole role,
    const std::vector<uint8_t>& salt,
    const std::vector<uint8_t>& localMessage = {},
    const std::vector<uint8_t>& peerMessage = {}
);

/// Сравнение confirm за постоянное время
/// @throws AuthenticationError при несовпадении
FTT_API void verifyConfirmation(const SecureBytes& expected, const std::vector<uint8_t>& received);

} // namespace KeyDerivation

} // namespace FileTT
