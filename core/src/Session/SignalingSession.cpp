// SignalingSession.cpp — обработка JSON сообщений сигнального канала

#include "filett/Session/SignalingSession.h"
#include "filett/Errors.h"
#include "filett/Security/ChunkCodec.h"
#include "filett/Security/Crypto.h"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <mutex>

using json = nlohmann::json;

namespace FileTT {

SignalingOptions SignalingOptions::fromConfig(const ServiceConfig& config, bool symmetric) {
    SignalingOptions options;
    options.symmetric = symmetric;
    options.requireKeyConfirmation = config.requireKeyConfirmation;
    options.allowPlaintextFallback = config.allowPlaintextFallback;
    return options;
}

// ═══════════════════════════════════════════════════════════
// Impl
// ═══════════════════════════════════════════════════════════

class SignalingSession::Impl {
public:
    Impl(SessionRegistry& registry, const std::string& transferId, SubscriberPtr channel,
         const std::string& password, SignalingOptions options)
        : m_registry(registry)
        , m_transferId(transferId)
        , m_channel(std::move(channel))
        , m_options(options)
        , m_session(registry.getOrCreate(transferId))
        , m_handshake(HandshakeSide::Server, password, transferId,
                      options.symmetric, options.requireKeyConfirmation) {
        if (!m_channel) {
            throw std::invalid_argument("SignalingSession requires a channel");
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Отправка
    // ═══════════════════════════════════════════════════════════

    bool send(const json& message) {
        bool sent = false;
        try {
            sent = m_channel->send(message.dump());
        } catch (const std::exception& e) {
            spdlog::warn("SignalingSession: send to {} threw: {}", m_channel->id(), e.what());
        }
        if (!sent) {
            spdlog::warn("SignalingSession: channel {} rejected message", m_channel->id());
        }
        return sent;
    }

    void sendError(ErrorCode code, const std::string& message) {
        send(json{{"type", "error"}, {"code", errorCodeToString(code)}, {"message", message}});
    }

    void ensureSubscribed() {
        if (!m_subscribed) {
            m_registry.subscribeProgress(m_transferId, m_channel);
            m_subscribed = true;
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Handshake
    // ═══════════════════════════════════════════════════════════

    bool open() {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            auto message = m_handshake.start();
            return send(json{{"type", "handshake"}, {"spake2_msg", Crypto::base64Encode(message)}});
        } catch (const TransferError& e) {
            sendError(e.code(), e.what());
            return false;
        }
    }

    void onPeerMessage(const json& j) {
        auto peerMessage = Crypto::base64Decode(j.at("spake2_msg").get<std::string>());
        KeyParams params = runHandshakeStep([&] { return m_handshake.acceptPeerMessage(peerMessage); });

        send(json{
            {"type", "key_params"},
            {"salt", Crypto::base64Encode(params.salt)},
            {"label", params.label},
            {"confirm", Crypto::base64Encode(params.confirm)}
        });

        if (m_handshake.isEstablished()) {
            establish();
        }
    }

    void onConfirm(const json& j) {
        auto confirm = Crypto::base64Decode(j.at("confirm").get<std::string>());
        bool wasEstablished = m_handshake.isEstablished();

        runHandshakeStep([&] {
            m_handshake.verifyPeerConfirmation(confirm);
            return 0;
        });

        if (!wasEstablished) {
            establish();
        }
        send(json{{"type", "key_confirmed"}});
    }

    /// Ошибка handshake прерывает передачу
    template <typename Step>
    auto runHandshakeStep(Step&& step) -> decltype(step()) {
        try {
            return step();
        } catch (const AuthenticationError&) {
            m_session->markFailed("Key confirmation failed");
            throw;
        } catch (const ProtocolError& e) {
            m_session->markFailed(e.what());
            throw;
        }
    }

    void establish() {
        if (!m_session->attachKey(m_handshake.takeKeyMaterial())) {
            if (m_session->isTerminal()) {
                throw ProtocolError("Transfer is " + std::string(transferStateToString(m_session->state())));
            }
            throw ProtocolError("Transfer " + m_transferId + " already has a key");
        }
        spdlog::info("SignalingSession: key established for {}", m_transferId);
        ensureSubscribed();
    }

    // ═══════════════════════════════════════════════════════════
    // Управляющие сообщения
    // ═══════════════════════════════════════════════════════════

    void onCancel() {
        m_registry.requestCancel(m_transferId);
        ensureSubscribed();
    }

    void onUploadChunk(const json& j) {
        ensureSubscribed();

        if (m_session->observeCancellation() || m_session->isTerminal()) {
            throw ProtocolError(std::string("Transfer is ") + transferStateToString(m_session->state()));
        }

        std::string filename = j.value("filename", "");
        auto data = Crypto::base64Decode(j.at("ciphertext").get<std::string>());
        bool framed = j.contains("iv") || j.contains("tag");

        std::vector<uint8_t> plaintext;
        auto key = m_session->keyMaterial();
        if (key) {
            if (!framed) {
                throw ProtocolError("Encrypted transfer requires iv and tag");
            }
            auto iv = Crypto::base64Decode(j.at("iv").get<std::string>());
            auto tag = Crypto::base64Decode(j.at("tag").get<std::string>());
            try {
                plaintext = ChunkCodec::decrypt(key->transportKey, iv, data, tag);
            } catch (const TransferError& e) {
                m_session->markFailed(e.what());
                throw;
            }
        } else {
            // После open() клиент обязан дождаться ключа: plaintext только без handshake
            if (m_handshake.state() != HandshakeState::Idle) {
                throw ProtocolError(std::string("Handshake is ") + handshakeStateToString(m_handshake.state()) +
                                    ", plaintext chunks rejected");
            }
            if (!m_options.allowPlaintextFallback || framed) {
                throw ProtocolError("No key established for transfer " + m_transferId);
            }
            if (!m_plaintextWarned) {
                spdlog::warn("SignalingSession: {} is receiving plaintext chunks", m_transferId);
                m_plaintextWarned = true;
            }
            plaintext = std::move(data);
        }

        if (m_chunkHandler) {
            try {
                m_chunkHandler(filename, plaintext);
            } catch (const TransportError& e) {
                m_session->markFailed(e.what());
                throw;
            }
        }

        if (j.contains("progress") && j["progress"].is_number()) {
            m_session->reportProgress(j["progress"].get<double>());
        } else {
            m_session->recordChunk(plaintext.size());
        }

        if (m_session->state() == TransferState::Completed && !m_completionReported) {
            m_completionReported = true;
            if (m_completionHandler) {
                m_completionHandler(m_transferId, filename);
            }
        }
    }

    // ═══════════════════════════════════════════════════════════
    // Диспетчер
    // ═══════════════════════════════════════════════════════════

    void handleMessage(const std::string& text) {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            json j = json::parse(text);
            if (!j.is_object()) {
                throw ProtocolError("Message must be a JSON object");
            }

            std::string action = j.value("action", "");
            if (action.empty() && j.contains("spake2_msg")) {
                onPeerMessage(j);
            } else if (action == "confirm") {
                onConfirm(j);
            } else if (action == "cancel") {
                onCancel();
            } else if (action == "upload_chunk") {
                onUploadChunk(j);
            } else {
                throw ProtocolError("Unknown action: " + action);
            }
        } catch (const json::exception& e) {
            spdlog::warn("SignalingSession: malformed message on {}: {}", m_transferId, e.what());
            sendError(ErrorCode::Protocol, std::string("Malformed message: ") + e.what());
        } catch (const TransferError& e) {
            spdlog::warn("SignalingSession: {} on {}: {}", errorCodeToString(e.code()), m_transferId, e.what());
            sendError(e.code(), e.what());
        } catch (const std::exception& e) {
            spdlog::error("SignalingSession: internal error on {}: {}", m_transferId, e.what());
            m_session->markFailed(e.what());
            sendError(ErrorCode::Internal, e.what());
        }
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_subscribed) {
            m_registry.unsubscribeProgress(m_transferId, m_channel);
            m_subscribed = false;
        }
    }

    SessionRegistry& m_registry;
    std::string m_transferId;
    SubscriberPtr m_channel;
    SignalingOptions m_options;
    std::shared_ptr<TransferSession> m_session;
    Handshake m_handshake;

    ChunkHandler m_chunkHandler;
    CompletionHandler m_completionHandler;

    std::mutex m_mutex;
    bool m_subscribed = false;
    bool m_plaintextWarned = false;
    bool m_completionReported = false;
};

// ═══════════════════════════════════════════════════════════
// SignalingSession
// ═══════════════════════════════════════════════════════════

SignalingSession::SignalingSession(SessionRegistry& registry, const std::string& transferId,
                                   SubscriberPtr channel, const std::string& password,
                                   SignalingOptions options)
    : m_impl(std::make_unique<Impl>(registry, transferId, std::move(channel), password, options)) {}

SignalingSession::~SignalingSession() {
    m_impl->close();
}

void SignalingSession::setChunkHandler(ChunkHandler handler) {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->m_chunkHandler = std::move(handler);
}

void SignalingSession::setCompletionHandler(CompletionHandler handler) {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->m_completionHandler = std::move(handler);
}

bool SignalingSession::open() {
    return m_impl->open();
}

void SignalingSession::handleMessage(const std::string& message) {
    m_impl->handleMessage(message);
}

void SignalingSession::close() {
    m_impl->close();
}

const std::string& SignalingSession::transferId() const {
    return m_impl->m_transferId;
}

std::shared_ptr<TransferSession> SignalingSession::session() const {
    return m_impl->m_session;
}

HandshakeState SignalingSession::handshakeState() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    return m_impl->m_handshake.state();
}

} // namespace FileTT
