// test_signaling.cpp — Сигнальный канал: handshake, confirm, upload_chunk, cancel

#include <gtest/gtest.h>
#include "filett/Errors.h"
#include "filett/Security/ChunkCodec.h"
#include "filett/Session/SignalingSession.h"
#include "TestHelpers.h"
#include <nlohmann/json.hpp>

using namespace FileTT;
using namespace FileTT::Test;
using json = nlohmann::json;

namespace {

/// Последнее сообщение канала с данным type (null если нет)
json lastOfType(const RecordingSubscriber& channel, const std::string& type) {
    json found;
    for (const auto& m : channel.messages()) {
        auto j = json::parse(m);
        if (j.value("type", "") == type) {
            found = j;
        }
    }
    return found;
}

bool isSnapshot(const std::string& message, const std::function<bool(const TransferSnapshot&)>& check) {
    auto j = json::parse(message);
    if (j.contains("type")) return false;
    auto snap = TransferSnapshot::fromJson(message);
    return snap && check(*snap);
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Клиент в тестах: та же логика, что у браузера
// ═══════════════════════════════════════════════════════════

class SignalingTest : public ::testing::Test {
protected:
    SessionRegistry registry{std::chrono::milliseconds(20)};
    std::shared_ptr<RecordingSubscriber> channel = std::make_shared<RecordingSubscriber>("client-1");

    std::vector<std::pair<std::string, std::vector<uint8_t>>> received;
    std::vector<std::string> completions;

    std::unique_ptr<SignalingSession> makeServer(const std::string& transferId, const std::string& password,
                                                 SignalingOptions options = {}) {
        auto server = std::make_unique<SignalingSession>(registry, transferId, channel, password, options);
        server->setChunkHandler([this](const std::string& filename, const std::vector<uint8_t>& data) {
            received.emplace_back(filename, data);
        });
        server->setCompletionHandler([this](const std::string& id, const std::string& filename) {
            completions.push_back(id + ":" + filename);
        });
        return server;
    }

    /// Пройти handshake со стороны клиента, вернуть ключевой материал клиента
    KeyMaterial runClient(SignalingSession& server, Handshake& client) {
        EXPECT_TRUE(server.open());
        auto hello = lastOfType(*channel, "handshake");
        EXPECT_FALSE(hello.is_null());

        auto clientMsg = client.start();
        client.receivePeerMessage(Crypto::base64Decode(hello["spake2_msg"].get<std::string>()));
        server.handleMessage(json{{"spake2_msg", Crypto::base64Encode(clientMsg)}}.dump());

        auto kp = lastOfType(*channel, "key_params");
        EXPECT_FALSE(kp.is_null());
        KeyParams params;
        params.salt = Crypto::base64Decode(kp["salt"].get<std::string>());
        params.label = kp["label"].get<std::string>();
        params.confirm = Crypto::base64Decode(kp["confirm"].get<std::string>());

        auto confirm = client.acceptKeyParams(params);
        server.handleMessage(json{{"action", "confirm"}, {"confirm", Crypto::base64Encode(confirm)}}.dump());
        return client.takeKeyMaterial();
    }

    static std::string uploadChunk(const SecureBytes& key, const std::vector<uint8_t>& data,
                                   const std::string& filename, double progress) {
        auto encrypted = ChunkCodec::encrypt(key, data);
        return json{
            {"action", "upload_chunk"},
            {"iv", Crypto::base64Encode(encrypted.nonce)},
            {"ciphertext", Crypto::base64Encode(encrypted.ciphertext)},
            {"tag", Crypto::base64Encode(encrypted.tag)},
            {"filename", filename},
            {"progress", progress}
        }.dump();
    }
};

// ═══════════════════════════════════════════════════════════
// Handshake
// ═══════════════════════════════════════════════════════════

TEST_F(SignalingTest, SharedSecretEstablishesKey) {
    auto server = makeServer("t-A", "shared-secret");
    Handshake client(HandshakeSide::Client, "shared-secret", "t-A");

    auto clientKey = runClient(*server, client);

    EXPECT_FALSE(lastOfType(*channel, "key_confirmed").is_null());
    EXPECT_TRUE(lastOfType(*channel, "error").is_null());
    EXPECT_EQ(server->handshakeState(), HandshakeState::Established);

    auto session = server->session();
    ASSERT_TRUE(session->hasKey());
    EXPECT_TRUE(session->keyMaterial()->transportKey == clientKey.transportKey);
    EXPECT_EQ(registry.subscriberCount("t-A"), 1u);
}

TEST_F(SignalingTest, KeyParamsMessageShape) {
    auto server = makeServer("t-shape", "pw");
    Handshake client(HandshakeSide::Client, "pw", "t-shape");
    server->open();
    client.start();
    server->handleMessage(json{{"spake2_msg", Crypto::base64Encode(client.start())}}.dump());

    auto kp = lastOfType(*channel, "key_params");
    ASSERT_FALSE(kp.is_null());
    EXPECT_EQ(kp["label"], "file_encryption");
    EXPECT_EQ(Crypto::base64Decode(kp["salt"].get<std::string>()).size(), KDF_SALT_SIZE);
    EXPECT_EQ(Crypto::base64Decode(kp["confirm"].get<std::string>()).size(), CONFIRMATION_SIZE);
    EXPECT_EQ(server->handshakeState(), HandshakeState::AwaitingConfirmation);
    EXPECT_FALSE(server->session()->hasKey());
}

TEST_F(SignalingTest, SymmetricVariant) {
    SignalingOptions options;
    options.symmetric = true;
    auto server = makeServer("t-S", "pairing-code", options);
    Handshake client(HandshakeSide::Client, "pairing-code", "t-S", true);

    auto clientKey = runClient(*server, client);
    EXPECT_TRUE(server->session()->keyMaterial()->transportKey == clientKey.transportKey);
}

TEST_F(SignalingTest, ForgedConfirmFailsTransfer) {
    auto server = makeServer("t-forged", "shared-secret");
    Handshake client(HandshakeSide::Client, "shared-secret", "t-forged");
    server->open();
    server->handleMessage(json{{"spake2_msg", Crypto::base64Encode(client.start())}}.dump());

    std::vector<uint8_t> forged(CONFIRMATION_SIZE, 0x5A);
    server->handleMessage(json{{"action", "confirm"}, {"confirm", Crypto::base64Encode(forged)}}.dump());

    auto error = lastOfType(*channel, "error");
    ASSERT_FALSE(error.is_null());
    EXPECT_EQ(error["code"], "authentication_error");

    auto snap = server->session()->snapshot();
    EXPECT_EQ(snap.state, TransferState::Failed);
    EXPECT_EQ(snap.error, "Key confirmation failed");
    EXPECT_FALSE(server->session()->hasKey());
}

TEST_F(SignalingTest, WrongPasswordDetectedByClient) {
    auto server = makeServer("t-wrong", "shared-secret");
    Handshake client(HandshakeSide::Client, "guess", "t-wrong");

    server->open();
    auto hello = lastOfType(*channel, "handshake");
    auto clientMsg = client.start();
    client.receivePeerMessage(Crypto::base64Decode(hello["spake2_msg"].get<std::string>()));
    server->handleMessage(json{{"spake2_msg", Crypto::base64Encode(clientMsg)}}.dump());

    auto kp = lastOfType(*channel, "key_params");
    KeyParams params;
    params.salt = Crypto::base64Decode(kp["salt"].get<std::string>());
    params.confirm = Crypto::base64Decode(kp["confirm"].get<std::string>());
    EXPECT_THROW(client.acceptKeyParams(params), AuthenticationError);
}

TEST_F(SignalingTest, ConfirmationOptional) {
    SignalingOptions options;
    options.requireKeyConfirmation = false;
    auto server = makeServer("t-opt", "pw", options);
    Handshake client(HandshakeSide::Client, "pw", "t-opt");

    server->open();
    server->handleMessage(json{{"spake2_msg", Crypto::base64Encode(client.start())}}.dump());
    EXPECT_TRUE(server->session()->hasKey());
    EXPECT_EQ(registry.subscriberCount("t-opt"), 1u);
}

TEST_F(SignalingTest, ConfirmBeforeHandshakeIsProtocolError) {
    auto server = makeServer("t-order", "pw");
    server->open();
    server->handleMessage(json{{"action", "confirm"},
                               {"confirm", Crypto::base64Encode(std::vector<uint8_t>(32, 1))}}.dump());

    auto error = lastOfType(*channel, "error");
    ASSERT_FALSE(error.is_null());
    EXPECT_EQ(error["code"], "protocol_error");
    EXPECT_EQ(server->session()->state(), TransferState::Failed);
}

// ═══════════════════════════════════════════════════════════
// Некорректный ввод
// ═══════════════════════════════════════════════════════════

TEST_F(SignalingTest, GarbageNeverThrows) {
    auto server = makeServer("t-garbage", "pw");

    for (const char* input : {"not json", "[1,2,3]", "{\"action\":\"dance\"}", "{\"spake2_msg\":\"***\"}",
                              "{\"action\":\"upload_chunk\"}", "{\"spake2_msg\":42}"}) {
        EXPECT_NO_THROW(server->handleMessage(input)) << input;
    }

    size_t errors = 0;
    for (const auto& m : channel->messages()) {
        auto j = json::parse(m);
        if (j.value("type", "") == "error") {
            errors++;
            EXPECT_TRUE(j.contains("code"));
            EXPECT_TRUE(j.contains("message"));
        }
    }
    EXPECT_EQ(errors, 6u);
}

TEST_F(SignalingTest, ShortPeerMessageFailsHandshake) {
    auto server = makeServer("t-short", "pw");
    server->open();
    server->handleMessage(json{{"spake2_msg", Crypto::base64Encode({'B', 1, 2})}}.dump());

    EXPECT_EQ(lastOfType(*channel, "error")["code"], "protocol_error");
    EXPECT_EQ(server->handshakeState(), HandshakeState::Failed);
    EXPECT_EQ(server->session()->state(), TransferState::Failed);
}

// ═══════════════════════════════════════════════════════════
// upload_chunk
// ═══════════════════════════════════════════════════════════

TEST_F(SignalingTest, EncryptedUploadReachesHandler) {
    auto server = makeServer("t-up", "shared-secret");
    Handshake client(HandshakeSide::Client, "shared-secret", "t-up");
    auto key = runClient(*server, client);

    auto part1 = patternBytes(1000, 1);
    auto part2 = patternBytes(500, 2);
    server->handleMessage(uploadChunk(key.transportKey, part1, "photo.jpg", 66.0));
    EXPECT_DOUBLE_EQ(server->session()->progress(), 66.0);
    EXPECT_TRUE(completions.empty());

    server->handleMessage(uploadChunk(key.transportKey, part2, "photo.jpg", 100.0));

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].first, "photo.jpg");
    EXPECT_EQ(received[0].second, part1);
    EXPECT_EQ(received[1].second, part2);

    EXPECT_EQ(server->session()->state(), TransferState::Completed);
    ASSERT_EQ(completions.size(), 1u);
    EXPECT_EQ(completions[0], "t-up:photo.jpg");

    EXPECT_TRUE(channel->waitFor([](const std::string& m) {
        return isSnapshot(m, [](const TransferSnapshot& s) { return s.completed && !s.canceled; });
    }));
}

TEST_F(SignalingTest, TamperedChunkFailsTransfer) {
    auto server = makeServer("t-tamper", "shared-secret");
    Handshake client(HandshakeSide::Client, "shared-secret", "t-tamper");
    auto key = runClient(*server, client);

    auto message = json::parse(uploadChunk(key.transportKey, patternBytes(64), "x.bin", 10.0));
    auto ciphertext = Crypto::base64Decode(message["ciphertext"].get<std::string>());
    ciphertext[0] ^= 0xFF;
    message["ciphertext"] = Crypto::base64Encode(ciphertext);
    server->handleMessage(message.dump());

    EXPECT_EQ(lastOfType(*channel, "error")["code"], "authentication_error");
    EXPECT_EQ(server->session()->state(), TransferState::Failed);
    EXPECT_TRUE(received.empty());
}

TEST_F(SignalingTest, EncryptedTransferRejectsPlainChunks) {
    auto server = makeServer("t-mixed", "shared-secret");
    Handshake client(HandshakeSide::Client, "shared-secret", "t-mixed");
    runClient(*server, client);

    server->handleMessage(json{{"action", "upload_chunk"},
                               {"ciphertext", Crypto::base64Encode({1, 2, 3})}}.dump());
    EXPECT_EQ(lastOfType(*channel, "error")["code"], "protocol_error");
    EXPECT_TRUE(received.empty());
}

TEST_F(SignalingTest, PlaintextFallback) {
    auto server = makeServer("t-plain", "pw");
    std::vector<uint8_t> data = {'h', 'i'};
    server->handleMessage(json{{"action", "upload_chunk"}, {"filename", "note.txt"},
                               {"ciphertext", Crypto::base64Encode(data)}}.dump());

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].second, data);
    EXPECT_EQ(server->session()->processedBytes(), 2u);
}

TEST_F(SignalingTest, PlaintextFallbackDisabled) {
    SignalingOptions options;
    options.allowPlaintextFallback = false;
    auto server = makeServer("t-strict", "pw", options);

    server->handleMessage(json{{"action", "upload_chunk"},
                               {"ciphertext", Crypto::base64Encode({1})}}.dump());
    EXPECT_EQ(lastOfType(*channel, "error")["code"], "protocol_error");
    EXPECT_TRUE(received.empty());
}

TEST_F(SignalingTest, PlainChunkAwaitingConfirmationRejected) {
    auto server = makeServer("t-downgrade", "shared-secret");
    Handshake client(HandshakeSide::Client, "shared-secret", "t-downgrade");
    server->open();
    server->handleMessage(json{{"spake2_msg", Crypto::base64Encode(client.start())}}.dump());
    ASSERT_EQ(server->handshakeState(), HandshakeState::AwaitingConfirmation);

    server->handleMessage(json{{"action", "upload_chunk"}, {"filename", "x.bin"},
                               {"ciphertext", Crypto::base64Encode({'p', 'w', 'n'})}}.dump());

    auto error = lastOfType(*channel, "error");
    ASSERT_FALSE(error.is_null());
    EXPECT_EQ(error["code"], "protocol_error");
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(server->session()->processedBytes(), 0u);
    EXPECT_EQ(server->session()->state(), TransferState::Pending);
}

TEST_F(SignalingTest, PlainChunkAfterOpenRejected) {
    auto server = makeServer("t-opened", "pw");
    server->open();
    ASSERT_EQ(server->handshakeState(), HandshakeState::AwaitingPeerMessage);

    server->handleMessage(json{{"action", "upload_chunk"},
                               {"ciphertext", Crypto::base64Encode({1, 2, 3})}}.dump());
    EXPECT_EQ(lastOfType(*channel, "error")["code"], "protocol_error");
    EXPECT_TRUE(received.empty());
    EXPECT_EQ(server->session()->processedBytes(), 0u);
}

TEST_F(SignalingTest, OptionsFromConfig) {
    ServiceConfig config;
    config.allowPlaintextFallback = false;
    config.requireKeyConfirmation = false;

    auto options = SignalingOptions::fromConfig(config);
    EXPECT_FALSE(options.allowPlaintextFallback);
    EXPECT_FALSE(options.requireKeyConfirmation);
    EXPECT_FALSE(options.symmetric);
    EXPECT_TRUE(SignalingOptions::fromConfig(config, true).symmetric);

    auto server = makeServer("t-cfg", "pw", options);
    server->handleMessage(json{{"action", "upload_chunk"},
                               {"ciphertext", Crypto::base64Encode({1})}}.dump());
    EXPECT_EQ(lastOfType(*channel, "error")["code"], "protocol_error");
    EXPECT_TRUE(received.empty());
}

TEST_F(SignalingTest, SinkFailureReported) {
    auto server = makeServer("t-sink", "pw");
    server->setChunkHandler([](const std::string&, const std::vector<uint8_t>&) {
        throw TransportError("disk full");
    });

    server->handleMessage(json{{"action", "upload_chunk"},
                               {"ciphertext", Crypto::base64Encode({1, 2})}}.dump());
    EXPECT_EQ(lastOfType(*channel, "error")["code"], "transport_error");
    EXPECT_EQ(server->session()->state(), TransferState::Failed);
}

// ═══════════════════════════════════════════════════════════
// cancel
// ═══════════════════════════════════════════════════════════

TEST_F(SignalingTest, CancelStopsUpload) {
    auto server = makeServer("t-cancel", "shared-secret");
    Handshake client(HandshakeSide::Client, "shared-secret", "t-cancel");
    auto key = runClient(*server, client);

    server->handleMessage(uploadChunk(key.transportKey, patternBytes(100), "big.iso", 30.0));
    server->handleMessage(json{{"action", "cancel"}}.dump());

    EXPECT_EQ(server->session()->state(), TransferState::Canceled);
    EXPECT_TRUE(channel->waitFor([](const std::string& m) {
        return isSnapshot(m, [](const TransferSnapshot& s) { return s.canceled && !s.completed; });
    }));

    server->handleMessage(uploadChunk(key.transportKey, patternBytes(100), "big.iso", 60.0));
    EXPECT_EQ(lastOfType(*channel, "error")["code"], "protocol_error");
    EXPECT_EQ(received.size(), 1u);
    EXPECT_TRUE(completions.empty());
}

TEST_F(SignalingTest, CancelBeforeHandshake) {
    auto server = makeServer("t-early", "pw");
    server->handleMessage(json{{"action", "cancel"}}.dump());
    server->handleMessage(json{{"action", "cancel"}}.dump());

    EXPECT_EQ(server->session()->state(), TransferState::Canceled);
    EXPECT_TRUE(lastOfType(*channel, "error").is_null());
}

TEST_F(SignalingTest, CancelDuringHandshakeReported) {
    SignalingOptions options;
    options.requireKeyConfirmation = false;
    auto server = makeServer("t-mid", "pw", options);
    Handshake client(HandshakeSide::Client, "pw", "t-mid");

    server->open();
    registry.requestCancel("t-mid");
    server->handleMessage(json{{"spake2_msg", Crypto::base64Encode(client.start())}}.dump());

    auto error = lastOfType(*channel, "error");
    ASSERT_FALSE(error.is_null());
    EXPECT_EQ(error["code"], "protocol_error");
    EXPECT_EQ(error["message"], "Transfer is canceled");
    EXPECT_FALSE(server->session()->hasKey());
}

TEST_F(SignalingTest, CloseUnsubscribes) {
    auto server = makeServer("t-close", "pw");
    server->handleMessage(json{{"action", "cancel"}}.dump());
    EXPECT_EQ(registry.subscriberCount("t-close"), 1u);

    server->close();
    // Terminal + нет подписчиков → запись удалена
    EXPECT_FALSE(registry.contains("t-close"));
}
