// test_presence_hub.cpp — Ростер клиентов, события, ping/timeout

#include <gtest/gtest.h>
#include "filett/Session/PresenceHub.h"
#include "TestHelpers.h"
#include <nlohmann/json.hpp>

using namespace FileTT;
using namespace FileTT::Test;
using json = nlohmann::json;

namespace {

std::vector<json> parsed(const RecordingSubscriber& subscriber) {
    std::vector<json> result;
    for (const auto& m : subscriber.messages()) {
        result.push_back(json::parse(m));
    }
    return result;
}

size_t countType(const RecordingSubscriber& subscriber, const std::string& type) {
    size_t n = 0;
    for (const auto& j : parsed(subscriber)) {
        if (j.value("type", "") == type) n++;
    }
    return n;
}

} // namespace

class PresenceHubTest : public ::testing::Test {
protected:
    SessionRegistry registry;
    PresenceHub hub{registry, std::chrono::seconds(30), std::chrono::seconds(90)};

    std::shared_ptr<RecordingSubscriber> alice = std::make_shared<RecordingSubscriber>("conn-alice");
    std::shared_ptr<RecordingSubscriber> bob = std::make_shared<RecordingSubscriber>("conn-bob");
};

// ═══════════════════════════════════════════════════════════
// Подключение
// ═══════════════════════════════════════════════════════════

TEST_F(PresenceHubTest, NewcomerReceivesRoster) {
    ASSERT_EQ(hub.connect("alice", alice), PresenceResult::Success);
    ASSERT_EQ(hub.connect("bob", bob), PresenceResult::Success);

    auto bobMessages = parsed(*bob);
    ASSERT_EQ(bobMessages.size(), 1u);
    EXPECT_EQ(bobMessages[0]["type"], "connected_users");
    auto users = bobMessages[0]["users"].get<std::vector<std::string>>();
    std::vector<std::string> expected = {"alice", "bob"};
    EXPECT_EQ(users, expected);
}

TEST_F(PresenceHubTest, OthersNotifiedOfConnect) {
    hub.connect("alice", alice);
    hub.connect("bob", bob);

    auto aliceMessages = parsed(*alice);
    ASSERT_EQ(aliceMessages.size(), 2u);
    EXPECT_EQ(aliceMessages[0]["type"], "connected_users");
    EXPECT_EQ(aliceMessages[1]["type"], "user_connected");
    EXPECT_EQ(aliceMessages[1]["client_id"], "bob");
}

TEST_F(PresenceHubTest, DuplicateClientRejected) {
    hub.connect("alice", alice);
    auto second = std::make_shared<RecordingSubscriber>("conn-alice-2");

    EXPECT_EQ(hub.connect("alice", second), PresenceResult::AlreadyConnected);
    EXPECT_EQ(second->count(), 0u);
    EXPECT_EQ(registry.presenceConnection("alice"), alice);
    EXPECT_EQ(countType(*alice, "user_connected"), 0u);
}

TEST_F(PresenceHubTest, InvalidArgumentsRejected) {
    EXPECT_EQ(hub.connect("", alice), PresenceResult::InvalidArgument);
    EXPECT_EQ(hub.connect("alice", nullptr), PresenceResult::InvalidArgument);
    EXPECT_TRUE(hub.connectedClients().empty());
}

TEST_F(PresenceHubTest, InvalidTimingRejected) {
    EXPECT_THROW(PresenceHub(registry, std::chrono::seconds(30), std::chrono::seconds(30)),
                 std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════
// Отключение
// ═══════════════════════════════════════════════════════════

TEST_F(PresenceHubTest, DisconnectNotifiesRemaining) {
    hub.connect("alice", alice);
    hub.connect("bob", bob);

    EXPECT_TRUE(hub.disconnect("bob"));
    EXPECT_FALSE(hub.isConnected("bob"));
    EXPECT_TRUE(bob->closed());

    auto last = json::parse(alice->last());
    EXPECT_EQ(last["type"], "user_disconnected");
    EXPECT_EQ(last["client_id"], "bob");
    EXPECT_EQ(last["reason"], "disconnected");

    EXPECT_FALSE(hub.disconnect("bob"));
}

TEST_F(PresenceHubTest, ReconnectAfterDisconnect) {
    hub.connect("alice", alice);
    hub.disconnect("alice");

    auto fresh = std::make_shared<RecordingSubscriber>("conn-alice-2");
    EXPECT_EQ(hub.connect("alice", fresh), PresenceResult::Success);
    EXPECT_TRUE(hub.isConnected("alice"));
}

TEST_F(PresenceHubTest, UnreachableClientDroppedOnBroadcast) {
    hub.connect("alice", alice);
    hub.connect("bob", bob);
    bob->setAlive(false);

    EXPECT_EQ(hub.notify("announcement"), 1u);
    EXPECT_FALSE(hub.isConnected("bob"));

    auto last = json::parse(alice->last());
    EXPECT_EQ(last["type"], "user_disconnected");
    EXPECT_EQ(last["reason"], "connection_lost");
}

// ═══════════════════════════════════════════════════════════
// Liveness
// ═══════════════════════════════════════════════════════════

TEST_F(PresenceHubTest, PingAfterIdleInterval) {
    auto t0 = PresenceHub::Clock::now();
    hub.connect("alice", alice);

    hub.checkLiveness(t0 + std::chrono::seconds(10));
    EXPECT_EQ(countType(*alice, "ping"), 0u);

    hub.checkLiveness(t0 + std::chrono::seconds(31));
    EXPECT_EQ(countType(*alice, "ping"), 1u);

    // Не чаще одного ping за интервал
    hub.checkLiveness(t0 + std::chrono::seconds(40));
    EXPECT_EQ(countType(*alice, "ping"), 1u);
}

TEST_F(PresenceHubTest, TouchKeepsClientAlive) {
    auto t0 = PresenceHub::Clock::now();
    hub.connect("alice", alice);

    hub.touch("alice", t0 + std::chrono::seconds(80));
    hub.checkLiveness(t0 + std::chrono::seconds(100));
    EXPECT_TRUE(hub.isConnected("alice"));
    EXPECT_EQ(countType(*alice, "ping"), 0u);
}

TEST_F(PresenceHubTest, SilentClientTimesOut) {
    auto t0 = PresenceHub::Clock::now();
    hub.connect("alice", alice);
    hub.connect("bob", bob);
    hub.touch("alice", t0 + std::chrono::seconds(85));

    hub.checkLiveness(t0 + std::chrono::seconds(95));
    EXPECT_FALSE(hub.isConnected("bob"));
    EXPECT_TRUE(hub.isConnected("alice"));

    auto last = json::parse(alice->last());
    EXPECT_EQ(last["type"], "user_disconnected");
    EXPECT_EQ(last["client_id"], "bob");
    EXPECT_EQ(last["reason"], "timeout");
}

TEST_F(PresenceHubTest, TimingFromConfig) {
    ServiceConfig config;
    config.presencePingIntervalSec = 5;
    config.presenceTimeoutSec = 20;
    PresenceHub configured(registry, config);

    auto t0 = PresenceHub::Clock::now();
    configured.connect("alice", alice);

    configured.checkLiveness(t0 + std::chrono::seconds(6));
    EXPECT_EQ(countType(*alice, "ping"), 1u);

    configured.checkLiveness(t0 + std::chrono::seconds(25));
    EXPECT_FALSE(configured.isConnected("alice"));
}

TEST_F(PresenceHubTest, WorkerStartsAndStops) {
    hub.start(std::chrono::milliseconds(10));
    EXPECT_TRUE(hub.isRunning());
    hub.start(std::chrono::milliseconds(10));
    hub.stop();
    EXPECT_FALSE(hub.isRunning());
}

// ═══════════════════════════════════════════════════════════
// События приложения
// ═══════════════════════════════════════════════════════════

TEST_F(PresenceHubTest, UploadCompleteReachesEveryone) {
    hub.connect("alice", alice);
    hub.connect("bob", bob);

    EXPECT_EQ(hub.notifyUploadComplete("t-42", "report.pdf"), 2u);

    for (const auto& client : {alice, bob}) {
        auto last = json::parse(client->last());
        EXPECT_EQ(last["type"], "upload_complete");
        EXPECT_EQ(last["transfer_id"], "t-42");
        EXPECT_EQ(last["filename"], "report.pdf");
    }
}

TEST_F(PresenceHubTest, NotifyRejectsNonObjectPayload) {
    hub.connect("alice", alice);
    EXPECT_THROW(hub.notify("x", "[1,2]"), std::invalid_argument);
    EXPECT_THROW(hub.notify("x", "{broken"), std::invalid_argument);
}
