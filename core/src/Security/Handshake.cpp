// Handshake.cpp — драйвер обмена ключами для серверной и клиентской сторон

#include "filett/Security/Handshake.h"
#include "filett/Errors.h"
#include <spdlog/spdlog.h>
#include <optional>

namespace FileTT {

const char* handshakeStateToString(HandshakeState state) {
    switch (state) {
        case HandshakeState::Idle:                 return "idle";
        case HandshakeState::AwaitingPeerMessage:  return "awaiting_peer_message";
        case HandshakeState::AwaitingKeyParams:    return "awaiting_key_params";
        case HandshakeState::AwaitingConfirmation: return "awaiting_confirmation";
        case HandshakeState::Established:          return "established";
        case HandshakeState::Failed:               return "failed";
        default:                                   return "unknown";
    }
}

// ═══════════════════════════════════════════════════════════
// Impl
// ═══════════════════════════════════════════════════════════

class Handshake::Impl {
public:
    Impl(HandshakeSide side, const std::string& password, const std::string& context,
         bool symmetric, bool requireConfirmation)
        : m_side(side)
        , m_role(symmetric ? PakeRole::Symmetric
                           : (side == HandshakeSide::Server ? PakeRole::Responder : PakeRole::Initiator))
        , m_requireConfirmation(requireConfirmation)
        , m_exchange(m_role, password, context) {}

    void expect(HandshakeState expected, HandshakeSide side, const char* operation) {
        if (m_side != side) {
            failWith(ProtocolError(std::string(operation) + " is not valid on this side"));
        }
        if (m_state != expected) {
            failWith(ProtocolError(std::string(operation) + " called in state " +
                                   handshakeStateToString(m_state)));
        }
    }

    [[noreturn]] void failWith(const TransferError& error) {
        wipe();
        m_state = HandshakeState::Failed;
        spdlog::warn("Handshake: {}", error.what());
        if (error.code() == ErrorCode::Authentication) {
            throw AuthenticationError(error.what());
        }
        throw ProtocolError(error.what());
    }

    void wipe() {
        m_secret.wipe();
        m_expectedPeerConfirmation.wipe();
        if (m_material) {
            m_material->wipe();
            m_material.reset();
        }
    }

    std::vector<uint8_t> start() {
        if (m_state != HandshakeState::Idle) {
            failWith(ProtocolError(std::string("start() called in state ") +
                                   handshakeStateToString(m_state)));
        }
        auto message = m_exchange.start();
        m_state = HandshakeState::AwaitingPeerMessage;
        return message;
    }

    KeyParams acceptPeerMessage(const std::vector<uint8_t>& peerMessage) {
        expect(HandshakeState::AwaitingPeerMessage, HandshakeSide::Server, "acceptPeerMessage");

        try {
            SecureBytes secret = m_exchange.finish(peerMessage);
            auto salt = Crypto::randomBytes(KDF_SALT_SIZE);
            m_material = KeyDerivation::deriveSessionKeys(
                secret, m_role, salt, m_exchange.outboundMessage(), m_exchange.peerMessage());
            m_expectedPeerConfirmation = m_material->expectedPeerConfirmation;
        } catch (const TransferError& e) {
            failWith(e);
        }

        KeyParams params;
        params.salt = m_material->salt;
        params.label = LABEL_FILE_ENCRYPTION;
        params.confirm = m_material->confirmation.bytes();

        m_state = m_requireConfirmation ? HandshakeState::AwaitingConfirmation
                                        : HandshakeState::Established;
        spdlog::debug("Handshake: key params issued ({})", handshakeStateToString(m_state));
        return params;
    }

    void verifyPeerConfirmation(const std::vector<uint8_t>& confirm) {
        if (m_side == HandshakeSide::Server && !m_requireConfirmation &&
            m_state == HandshakeState::Established) {
            // Необязательный confirm всё равно должен совпасть
            try {
                KeyDerivation::verifyConfirmation(m_expectedPeerConfirmation, confirm);
            } catch (const TransferError& e) {
                failWith(e);
            }
            return;
        }

        expect(HandshakeState::AwaitingConfirmation, HandshakeSide::Server, "verifyPeerConfirmation");
        try {
            KeyDerivation::verifyConfirmation(m_expectedPeerConfirmation, confirm);
        } catch (const TransferError& e) {
            failWith(e);
        }
        m_state = HandshakeState::Established;
        spdlog::info("Handshake: key confirmed ({})", pakeRoleToString(m_role));
    }

    void receivePeerMessage(const std::vector<uint8_t>& peerMessage) {
        expect(HandshakeState::AwaitingPeerMessage, HandshakeSide::Client, "receivePeerMessage");
        try {
            m_secret = m_exchange.finish(peerMessage);
        } catch (const TransferError& e) {
            failWith(e);
        }
        m_state = HandshakeState::AwaitingKeyParams;
    }

    std::vector<uint8_t> acceptKeyParams(const KeyParams& params) {
        expect(HandshakeState::AwaitingKeyParams, HandshakeSide::Client, "acceptKeyParams");

        if (params.label != LABEL_FILE_ENCRYPTION) {
            failWith(ProtocolError("Unexpected key label: " + params.label));
        }
        if (params.confirm.empty() && m_requireConfirmation) {
            failWith(AuthenticationError("Server confirmation missing"));
        }

        try {
            m_material = KeyDerivation::deriveSessionKeys(
                m_secret, m_role, params.salt, m_exchange.outboundMessage(), m_exchange.peerMessage());
            if (!params.confirm.empty()) {
                KeyDerivation::verifyConfirmation(m_material->expectedPeerConfirmation, params.confirm);
            }
        } catch (const TransferError& e) {
            failWith(e);
        }

        m_secret.wipe();
        m_state = HandshakeState::Established;
        spdlog::info("Handshake: key established ({})", pakeRoleToString(m_role));
        return m_material->confirmation.bytes();
    }

    KeyMaterial takeKeyMaterial() {
        if (m_state != HandshakeState::Established || !m_material) {
            throw ProtocolError(std::string("No key material in state ") +
                                handshakeStateToString(m_state));
        }
        KeyMaterial material = std::move(*m_material);
        m_material.reset();
        return material;
    }

    HandshakeSide m_side;
    PakeRole m_role;
    bool m_requireConfirmation;
    HandshakeState m_state = HandshakeState::Idle;

    KeyExchange m_exchange;
    SecureBytes m_secret;
    SecureBytes m_expectedPeerConfirmation;   // Переживает takeKeyMaterial()
    std::optional<KeyMaterial> m_material;
};

// ═══════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════

Handshake::Handshake(HandshakeSide side, const std::string& password, const std::string& context,
                     bool symmetric, bool requireConfirmation)
    : m_impl(std::make_unique<Impl>(side, password, context, symmetric, requireConfirmation)) {}

Handshake::~Handshake() = default;

HandshakeSide Handshake::side() const {
    return m_impl->m_side;
}

PakeRole Handshake::role() const {
    return m_impl->m_role;
}

HandshakeState Handshake::state() const {
    return m_impl->m_state;
}

std::vector<uint8_t> Handshake::start() {
    return m_impl->start();
}

KeyParams Handshake::acceptPeerMessage(const std::vector<uint8_t>& peerMessage) {
    return m_impl->acceptPeerMessage(peerMessage);
}

void Handshake::verifyPeerConfirmation(const std::vector<uint8_t>& confirm) {
    m_impl->verifyPeerConfirmation(confirm);
}

void Handshake::receivePeerMessage(const std::vector<uint8_t>& peerMessage) {
    m_impl->receivePeerMessage(peerMessage);
}

std::vector<uint8_t> Handshake::acceptKeyParams(const KeyParams& params) {
    return m_impl->acceptKeyParams(params);
}

KeyMaterial Handshake::takeKeyMaterial() {
    return m_impl->takeKeyMaterial();
}

} // namespace FileTT
