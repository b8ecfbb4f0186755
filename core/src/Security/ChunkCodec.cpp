// ChunkCodec.cpp — AES-256-GCM через OpenSSL EVP

#include "filett/Security/ChunkCodec.h"
#include "filett/Errors.h"
#include <spdlog/spdlog.h>
#include <openssl/evp.h>
#include <limits>
#include <memory>
#include <stdexcept>

namespace FileTT {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

void checkKey(const SecureBytes& key) {
    if (key.size() != GCM_KEY_SIZE) {
        throw std::invalid_argument("AES-256-GCM key must be 32 bytes, got " +
                                    std::to_string(key.size()));
    }
}

void checkNonce(const std::vector<uint8_t>& nonce) {
    if (nonce.size() != GCM_NONCE_SIZE) {
        throw ProtocolError("AES-GCM nonce must be 12 bytes, got " + std::to_string(nonce.size()));
    }
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Конструирование
// ═══════════════════════════════════════════════════════════

ChunkCodec::ChunkCodec()
    : m_mode(CodecMode::Plaintext)
    , m_nonceMode(NonceMode::Random) {
    spdlog::warn("ChunkCodec: no key established, chunks pass through as plaintext");
}

ChunkCodec::ChunkCodec(const SecureBytes& key, NonceMode nonceMode)
    : m_key(key)
    , m_mode(CodecMode::Encrypted)
    , m_nonceMode(nonceMode) {
    checkKey(m_key);
    if (m_nonceMode == NonceMode::Counter) {
        m_noncePrefix = Crypto::randomBytes(NONCE_PREFIX_SIZE);
    }
}

ChunkCodec::ChunkCodec(const SecureBytes& key, uint64_t expectedChunks)
    : ChunkCodec(key, expectedChunks > RANDOM_NONCE_LIMIT ? NonceMode::Counter : NonceMode::Random) {
    if (m_nonceMode == NonceMode::Counter) {
        spdlog::info("ChunkCodec: {} chunks expected, using counter nonces", expectedChunks);
    }
}

ChunkCodec::~ChunkCodec() = default;

NonceMode ChunkCodec::nonceMode() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_nonceMode;
}

// ═══════════════════════════════════════════════════════════
// Nonce policy
// ═══════════════════════════════════════════════════════════

std::vector<uint8_t> ChunkCodec::nextNonce() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_nonceMode == NonceMode::Random && m_sealed.load() >= RANDOM_NONCE_LIMIT) {
        // Вероятность коллизии случайных nonce перестаёт быть пренебрежимой
        spdlog::info("ChunkCodec: random nonce budget exhausted, switching to counter nonces");
        m_nonceMode = NonceMode::Counter;
        m_noncePrefix = Crypto::randomBytes(NONCE_PREFIX_SIZE);
        m_counter = 0;
    }

    if (m_nonceMode == NonceMode::Random) {
        return Crypto::randomBytes(GCM_NONCE_SIZE);
    }

    if (m_counter == std::numeric_limits<uint64_t>::max()) {
        throw std::runtime_error("Nonce counter exhausted, transfer key must be renegotiated");
    }

    // prefix(4) ‖ counter(8, big-endian)
    std::vector<uint8_t> nonce(m_noncePrefix);
    uint64_t value = m_counter++;
    for (int shift = 56; shift >= 0; shift -= 8) {
        nonce.push_back(static_cast<uint8_t>(value >> shift));
    }
    return nonce;
}

// ═══════════════════════════════════════════════════════════
// seal / open
// ═══════════════════════════════════════════════════════════

std::vector<uint8_t> ChunkCodec::seal(const std::vector<uint8_t>& chunk) {
    if (m_mode == CodecMode::Plaintext) {
        return chunk;
    }

    auto encrypted = encryptWithNonce(m_key, nextNonce(), chunk);
    m_sealed++;
    return toFrame(encrypted);
}

std::vector<uint8_t> ChunkCodec::open(const std::vector<uint8_t>& frame) const {
    if (m_mode == CodecMode::Plaintext) {
        return frame;
    }

    auto chunk = fromFrame(frame);
    return decrypt(m_key, chunk.nonce, chunk.ciphertext, chunk.tag);
}

// ═══════════════════════════════════════════════════════════
// AES-256-GCM
// ═══════════════════════════════════════════════════════════

EncryptedChunk ChunkCodec::encrypt(const SecureBytes& key, const std::vector<uint8_t>& plaintext) {
    return encryptWithNonce(key, Crypto::randomBytes(GCM_NONCE_SIZE), plaintext);
}

EncryptedChunk ChunkCodec::encryptWithNonce(
    const SecureBytes& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& plaintext
) {
    checkKey(key);
    checkNonce(nonce);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(GCM_NONCE_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to initialize AES-256-GCM");
    }

    EncryptedChunk result;
    result.nonce = nonce;
    result.ciphertext.resize(plaintext.size());
    result.tag.resize(GCM_TAG_SIZE);

    int written = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &written,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            throw std::runtime_error("AES-GCM encryption failed");
        }
    }

    uint8_t tail[GCM_TAG_SIZE];
    int tailLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), tail, &tailLen) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(GCM_TAG_SIZE), result.tag.data()) != 1) {
        throw std::runtime_error("AES-GCM finalization failed");
    }

    // GCM: потоковый режим, Final ничего не дописывает
    result.ciphertext.resize(static_cast<size_t>(written));
    return result;
}

std::vector<uint8_t> ChunkCodec::decrypt(
    const SecureBytes& key,
    const std::vector<uint8_t>& nonce,
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& tag
) {
    checkKey(key);
    checkNonce(nonce);
    if (tag.size() != GCM_TAG_SIZE) {
        throw ProtocolError("AES-GCM tag must be 16 bytes, got " + std::to_string(tag.size()));
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(GCM_NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        throw std::runtime_error("Failed to initialize AES-256-GCM");
    }

    SecureBytes plaintext(ciphertext.size());
    int written = 0;
    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &written,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            throw AuthenticationError("AES-GCM decryption failed");
        }
    }

    std::vector<uint8_t> tagCopy(tag);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(GCM_TAG_SIZE), tagCopy.data()) != 1) {
        throw std::runtime_error("Failed to set authentication tag");
    }

    uint8_t tail[GCM_TAG_SIZE];
    int tailLen = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), tail, &tailLen) != 1) {
        // SecureBytes затрёт частично расшифрованные данные
        spdlog::warn("ChunkCodec: authentication tag verification failed");
        throw AuthenticationError("Chunk authentication failed, data corrupted or tampered");
    }

    std::vector<uint8_t> result(plaintext.data(), plaintext.data() + written);
    return result;
}

// ═══════════════════════════════════════════════════════════
// Framing
// ═══════════════════════════════════════════════════════════

std::vector<uint8_t> ChunkCodec::toFrame(const EncryptedChunk& chunk) {
    checkNonce(chunk.nonce);
    if (chunk.tag.size() != GCM_TAG_SIZE) {
        throw ProtocolError("AES-GCM tag must be 16 bytes, got " + std::to_string(chunk.tag.size()));
    }

    std::vector<uint8_t> frame;
    frame.reserve(CHUNK_FRAME_OVERHEAD + chunk.ciphertext.size());
    frame.insert(frame.end(), chunk.nonce.begin(), chunk.nonce.end());
    frame.insert(frame.end(), chunk.tag.begin(), chunk.tag.end());
    frame.insert(frame.end(), chunk.ciphertext.begin(), chunk.ciphertext.end());
    return frame;
}

EncryptedChunk ChunkCodec::fromFrame(const std::vector<uint8_t>& frame) {
    if (frame.size() < CHUNK_FRAME_OVERHEAD) {
        throw ProtocolError("Chunk frame too short: " + std::to_string(frame.size()) + " bytes");
    }

    EncryptedChunk chunk;
    auto tagBegin = frame.begin() + GCM_NONCE_SIZE;
    auto dataBegin = tagBegin + GCM_TAG_SIZE;
    chunk.nonce.assign(frame.begin(), tagBegin);
    chunk.tag.assign(tagBegin, dataBegin);
    chunk.ciphertext.assign(dataBegin, frame.end());
    return chunk;
}

} // namespace FileTT
