#include "filett/Security/KeyDerivation.h"
#include "filett/Errors.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace FileTT {

const char* confirmationLabel(PakeRole role) {
    switch (role) {
        case PakeRole::Initiator: return LABEL_CONFIRM_A;
        case PakeRole::Responder: return LABEL_CONFIRM_B;
        case PakeRole::Symmetric: return LABEL_CONFIRM_S;
        default:                  return LABEL_CONFIRM_A;
    }
}

void KeyMaterial::wipe() {
    rawSecret.wipe();
    transportKey.wipe();
    confirmation.wipe();
    expectedPeerConfirmation.wipe();
    salt.clear();
}

namespace KeyDerivation {

namespace {

std::string confirmationInfo(PakeRole role, const std::vector<uint8_t>& senderMessage) {
    std::string info = confirmationLabel(role);
    if (role == PakeRole::Symmetric) {
        if (senderMessage.empty()) {
            throw std::invalid_argument("Symmetric confirmation requires the sender handshake message");
        }
        info.append(senderMessage.begin(), senderMessage.end());
    }
    return info;
}

} // namespace

DerivedKey expand(const SecureBytes& secret, const std::string& label, size_t length) {
    DerivedKey result;
    result.salt = Crypto::randomBytes(KDF_SALT_SIZE);
    result.key = expandWithSalt(secret, label, result.salt, length);
    return result;
}

SecureBytes expandWithSalt(
    const SecureBytes& secret,
    const std::string& label,
    const std::vector<uint8_t>& salt,
    size_t length
) {
    if (secret.empty()) {
        throw std::invalid_argument("Cannot derive keys from an empty secret");
    }
    if (label.empty()) {
        throw std::invalid_argument("Derivation label cannot be empty");
    }
    return SecureBytes(Crypto::hkdf(secret.bytes(), salt, label, length));
}

KeyMaterial deriveSessionKeys(
    const SecureBytes& secret,
    PakeRole role,
    const std::vector<uint8_t>& salt,
    const std::vector<uint8_t>& localMessage,
    const std::vector<uint8_t>& peerMessage
) {
    if (salt.size() != KDF_SALT_SIZE) {
        throw ProtocolError("Invalid salt length: " + std::to_string(salt.size()));
    }

    KeyMaterial material;
    material.rawSecret = secret;
    material.salt = salt;
    material.transportKey = expandWithSalt(secret, LABEL_FILE_ENCRYPTION, salt, TRANSPORT_KEY_SIZE);
    material.confirmation = expandWithSalt(
        secret, confirmationInfo(role, localMessage), salt, CONFIRMATION_SIZE);
    material.expectedPeerConfirmation = expandWithSalt(
        secret, confirmationInfo(pakePeerRole(role), peerMessage), salt, CONFIRMATION_SIZE);
    return material;
}

void verifyConfirmation(const SecureBytes& expected, const std::vector<uint8_t>& received) {
    if (expected.empty() || !Crypto::constantTimeEquals(expected.bytes(), received)) {
        spdlog::warn("KeyDerivation: key confirmation mismatch");
        throw AuthenticationError("Key confirmation failed");
    }
}

} // namespace KeyDerivation

} // namespace FileTT
