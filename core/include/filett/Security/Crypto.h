// Crypto.h — Криптографические примитивы поверх OpenSSL
// Случайные байты, HKDF-SHA256, SHA-256, base64, UUID

#pragma once

#include "../export.h"
#include <cstdint>
#include <string>
#include <vector>

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// SecureBytes: буфер секрета, затирается при разрушении
// ═══════════════════════════════════════════════════════════

class FTT_API SecureBytes {
public:
    SecureBytes() = default;
    explicit SecureBytes(size_t size) : m_data(size, 0) {}
    explicit SecureBytes(std::vector<uint8_t> data) : m_data(std::move(data)) {}
    ~SecureBytes();

    SecureBytes(const SecureBytes& other) : m_data(other.m_data) {}
    SecureBytes& operator=(const SecureBytes& other);
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    uint8_t* data() { return m_data.data(); }
    const uint8_t* data() const { return m_data.data(); }
    size_t size() const { return m_data.size(); }
    bool empty() const { return m_data.empty(); }

    const std::vector<uint8_t>& bytes() const { return m_data; }

    /// Затереть и очистить
    void wipe();

    bool operator==(const SecureBytes& other) const;
    bool operator!=(const SecureBytes& other) const { return !(*this == other); }

private:
    std::vector<uint8_t> m_data;
};

namespace Crypto {

constexpr size_t SHA256_SIZE = 32;

/// Генерация криптографически стойких случайных байт
/// @throws std::runtime_error если RAND_bytes не сработал
FTT_API std::vector<uint8_t> randomBytes(size_t count);

/// HKDF-SHA256 (RFC 5869)
/// @param salt Пустая соль = HashLen нулей
FTT_API std::vector<uint8_t> hkdf(
    const std::vector<uint8_t>& ikm,
    const std::vector<uint8_t>& salt,
    const std::string& info,
    size_t outputLength
);

/// SHA-256 от произвольных байт
FTT_API std::vector<uint8_t> sha256(const uint8_t* data, size_t size);
FTT_API std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);
FTT_API std::vector<uint8_t> sha256(const std::string& data);

/// Сравнение за постоянное время
FTT_API bool constantTimeEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

/// Затереть буфер (OPENSSL_cleanse)
FTT_API void secureZero(void* data, size_t size);

/// Base64 (стандартный алфавит, с padding)
FTT_API std::string base64Encode(const std::vector<uint8_t>& data);

/// @throws ProtocolError при некорректном вводе
FTT_API std::vector<uint8_t> base64Decode(const std::string& text);

/// Генерация UUID v4
FTT_API std::string generateUUID();

} // namespace Crypto

} // namespace FileTT
