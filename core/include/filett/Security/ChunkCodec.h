// ChunkCodec.h — AES-256-GCM шифрование отдельных chunks файла
// Wire frame: nonce(12) ‖ tag(16) ‖ ciphertext

#pragma once

#include "../export.h"
#include "../Types.h"
#include "Crypto.h"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// Константы
// ═══════════════════════════════════════════════════════════

constexpr size_t GCM_KEY_SIZE = 32;
constexpr size_t GCM_NONCE_SIZE = 12;
constexpr size_t GCM_TAG_SIZE = 16;
constexpr size_t CHUNK_FRAME_OVERHEAD = GCM_NONCE_SIZE + GCM_TAG_SIZE;

constexpr size_t NONCE_PREFIX_SIZE = 4;                    // Counter mode: 4 случайных байта
constexpr uint64_t RANDOM_NONCE_LIMIT = 1ULL << 32;        // Дальше только счётчик

// ═══════════════════════════════════════════════════════════
// EncryptedChunk: разобранный frame
// ═══════════════════════════════════════════════════════════

struct FTT_API EncryptedChunk {
    std::vector<uint8_t> nonce;        // 12 байт
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;          // 16 байт
};

// ═══════════════════════════════════════════════════════════
// ChunkCodec
// ═══════════════════════════════════════════════════════════

class FTT_API ChunkCodec {
public:
    /// Кодек без ключа: явный режим Plaintext, байты проходят как есть
    ChunkCodec();

    /// @throws std::invalid_argument если ключ не 32 байта
    explicit ChunkCodec(const SecureBytes& key, NonceMode nonceMode = NonceMode::Random);

    /// Кодек для передачи с известным числом chunks.
    /// Больше 2^32 chunks → NonceMode::Counter.
    ChunkCodec(const SecureBytes& key, uint64_t expectedChunks);

    ~ChunkCodec();

    // Запрет копирования
    ChunkCodec(const ChunkCodec&) = delete;
    ChunkCodec& operator=(const ChunkCodec&) = delete;

    CodecMode mode() const { return m_mode; }
    NonceMode nonceMode() const;
    bool isEncrypted() const { return m_mode == CodecMode::Encrypted; }
    uint64_t chunksSealed() const { return m_sealed.load(); }

    /// Зашифровать chunk и вернуть frame (Plaintext: байты без изменений)
    /// @throws std::runtime_error при исчерпании счётчика nonce
    std::vector<uint8_t> seal(const std::vector<uint8_t>& chunk);

    /// Разобрать и расшифровать frame (Plaintext: байты без изменений)
    /// @throws ProtocolError если frame короче 28 байт
    /// @throws AuthenticationError если тег не сошёлся
    std::vector<uint8_t> open(const std::vector<uint8_t>& frame) const;

    // ═══════════════════════════════════════════════════════════
    // Stateless операции
    // ═══════════════════════════════════════════════════════════

    /// Зашифровать со свежим случайным nonce
    static EncryptedChunk encrypt(const SecureBytes& key, const std::vector<uint8_t>& plaintext);

    static EncryptedChunk encryptWithNonce(
        const SecureBytes& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& plaintext
    );

    /// Частичный plaintext никогда не возвращается
    /// @throws AuthenticationError если тег не сошёлся
    static std::vector<uint8_t> decrypt(
        const SecureBytes& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& tag
    );

    static std::vector<uint8_t> toFrame(const EncryptedChunk& chunk);

    /// @throws ProtocolError если frame короче nonce + tag
    static EncryptedChunk fromFrame(const std::vector<uint8_t>& frame);

private:
    std::vector<uint8_t> nextNonce();

    SecureBytes m_key;
    CodecMode m_mode;
    NonceMode m_nonceMode;
    std::vector<uint8_t> m_noncePrefix;
    uint64_t m_counter = 0;
    std::atomic<uint64_t> m_sealed{0};
    mutable std::mutex m_mutex;
};

} // namespace FileTT
