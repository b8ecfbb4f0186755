// Crypto.cpp — Криптографические примитивы
// Криптография через OpenSSL

#include "filett/Security/Crypto.h"
#include "filett/Errors.h"
#include <spdlog/spdlog.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>
#include <stdexcept>

#ifdef _WIN32
#include <rpc.h>
#pragma comment(lib, "rpcrt4.lib")
#else
#include <uuid/uuid.h>
#endif

namespace FileTT {

// ═══════════════════════════════════════════════════════════
// SecureBytes
// ═══════════════════════════════════════════════════════════

SecureBytes::~SecureBytes() {
    wipe();
}

SecureBytes& SecureBytes::operator=(const SecureBytes& other) {
    if (this != &other) {
        wipe();
        m_data = other.m_data;
    }
    return *this;
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : m_data(std::move(other.m_data)) {
    other.m_data.clear();
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        wipe();
        m_data = std::move(other.m_data);
        other.m_data.clear();
    }
    return *this;
}

void SecureBytes::wipe() {
    if (!m_data.empty()) {
        OPENSSL_cleanse(m_data.data(), m_data.size());
        m_data.clear();
    }
}

bool SecureBytes::operator==(const SecureBytes& other) const {
    return Crypto::constantTimeEquals(m_data, other.m_data);
}

namespace Crypto {

std::vector<uint8_t> randomBytes(size_t count) {
    std::vector<uint8_t> result(count);
    if (count == 0) {
        return result;
    }
    if (RAND_bytes(result.data(), static_cast<int>(count)) != 1) {
        spdlog::error("Crypto::randomBytes: RAND_bytes failed");
        throw std::runtime_error("Failed to generate random bytes");
    }
    return result;
}

std::vector<uint8_t> hkdf(
    const std::vector<uint8_t>& ikm,
    const std::vector<uint8_t>& salt,
    const std::string& info,
    size_t outputLength
) {
    if (ikm.empty()) {
        throw std::invalid_argument("HKDF input key material cannot be empty");
    }
    if (outputLength == 0 || outputLength > 255 * SHA256_SIZE) {
        throw std::invalid_argument("HKDF output length out of range: " + std::to_string(outputLength));
    }

    std::vector<uint8_t> result(outputLength);

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) {
        throw std::runtime_error("EVP_PKEY_CTX_new_id failed");
    }

    bool success = false;
    do {
        if (EVP_PKEY_derive_init(pctx) <= 0) break;
        if (EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) <= 0) break;
        // Пустая соль: OpenSSL подставит HashLen нулей
        if (!salt.empty() &&
            EVP_PKEY_CTX_set1_hkdf_salt(pctx, salt.data(), static_cast<int>(salt.size())) <= 0) break;
        if (EVP_PKEY_CTX_set1_hkdf_key(pctx, ikm.data(), static_cast<int>(ikm.size())) <= 0) break;
        if (!info.empty() &&
            EVP_PKEY_CTX_add1_hkdf_info(pctx,
                reinterpret_cast<const unsigned char*>(info.data()),
                static_cast<int>(info.size())) <= 0) break;

        size_t outlen = outputLength;
        if (EVP_PKEY_derive(pctx, result.data(), &outlen) <= 0) break;

        success = (outlen == outputLength);
    } while (false);

    EVP_PKEY_CTX_free(pctx);

    if (!success) {
        OPENSSL_cleanse(result.data(), result.size());
        throw std::runtime_error("HKDF derivation failed");
    }

    return result;
}

std::vector<uint8_t> sha256(const uint8_t* data, size_t size) {
    std::vector<uint8_t> digest(SHA256_SIZE);
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest.data(), &length, EVP_sha256(), nullptr) != 1 ||
        length != SHA256_SIZE) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return digest;
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

std::vector<uint8_t> sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

bool constantTimeEquals(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void secureZero(void* data, size_t size) {
    if (data && size > 0) {
        OPENSSL_cleanse(data, size);
    }
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }
    std::string result(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                  data.data(), static_cast<int>(data.size()));
    result.resize(static_cast<size_t>(written));
    return result;
}

std::vector<uint8_t> base64Decode(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw ProtocolError("Invalid base64 length: " + std::to_string(text.size()));
    }

    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;

    std::vector<uint8_t> result(3 * text.size() / 4);
    int decoded = EVP_DecodeBlock(result.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        throw ProtocolError("Invalid base64 input");
    }
    // EVP_DecodeBlock не учитывает padding
    result.resize(static_cast<size_t>(decoded) - padding);
    return result;
}

std::string generateUUID() {
#ifdef _WIN32
    UUID uuid;
    UuidCreate(&uuid);
    RPC_CSTR uuidStr;
    UuidToStringA(&uuid, &uuidStr);
    std::string result(reinterpret_cast<char*>(uuidStr));
    RpcStringFreeA(&uuidStr);
    return result;
#else
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
#endif
}

} // namespace Crypto

} // namespace FileTT
