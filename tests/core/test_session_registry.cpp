// test_session_registry.cpp — Реестр передач, подписчики, отмена, presence

#include <gtest/gtest.h>
#include "filett/Session/SessionRegistry.h"
#include "TestHelpers.h"
#include <algorithm>
#include <set>
#include <thread>

using namespace FileTT;
using namespace FileTT::Test;

class SessionRegistryTest : public ::testing::Test {
protected:
    SessionRegistry registry{std::chrono::milliseconds(20)};
};

// ═══════════════════════════════════════════════════════════
// Передачи
// ═══════════════════════════════════════════════════════════

TEST_F(SessionRegistryTest, GetOrCreateReturnsSameSession) {
    auto first = registry.getOrCreate("t-1");
    auto second = registry.getOrCreate("t-1");

    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->state(), TransferState::Pending);
    EXPECT_TRUE(registry.contains("t-1"));
    EXPECT_EQ(registry.transferCount(), 1u);
}

TEST_F(SessionRegistryTest, FindUnknownReturnsNull) {
    EXPECT_EQ(registry.find("missing"), nullptr);
    EXPECT_FALSE(registry.contains("missing"));
}

TEST_F(SessionRegistryTest, EmptyIdRejected) {
    EXPECT_THROW(registry.getOrCreate(""), std::invalid_argument);
}

TEST_F(SessionRegistryTest, CreateTransferGeneratesUniqueIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 10; ++i) {
        ids.insert(registry.createTransfer()->transferId());
    }
    EXPECT_EQ(ids.size(), 10u);
    EXPECT_EQ(registry.transferCount(), 10u);
    EXPECT_EQ(ids.begin()->size(), 36u);
}

TEST_F(SessionRegistryTest, ConcurrentGetOrCreateYieldsOneSession) {
    std::vector<std::shared_ptr<TransferSession>> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([this, &results, i] { results[i] = registry.getOrCreate("shared"); });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& session : results) {
        EXPECT_EQ(session.get(), results[0].get());
    }
    EXPECT_EQ(registry.transferCount(), 1u);
}

// ═══════════════════════════════════════════════════════════
// Подписчики и удаление записей
// ═══════════════════════════════════════════════════════════

TEST_F(SessionRegistryTest, SubscriberReceivesSnapshots) {
    auto client = std::make_shared<RecordingSubscriber>("c-1");
    auto session = registry.subscribeProgress("t-1", client);

    ASSERT_NE(session, nullptr);
    EXPECT_EQ(registry.subscriberCount("t-1"), 1u);
    EXPECT_TRUE(client->waitFor([](const std::string& m) {
        auto snap = TransferSnapshot::fromJson(m);
        return snap && snap->transferId == "t-1";
    }));

    session->reportProgress(60.0);
    EXPECT_TRUE(client->waitFor([](const std::string& m) {
        auto snap = TransferSnapshot::fromJson(m);
        return snap && snap->progress == 60.0;
    }));
}

TEST_F(SessionRegistryTest, DuplicateSubscriptionIgnored) {
    auto client = std::make_shared<RecordingSubscriber>("c-1");
    registry.subscribeProgress("t-1", client);
    registry.subscribeProgress("t-1", client);
    EXPECT_EQ(registry.subscriberCount("t-1"), 1u);
}

TEST_F(SessionRegistryTest, EntryKeptWhileSessionActive) {
    auto client = std::make_shared<RecordingSubscriber>("c-1");
    registry.subscribeProgress("t-1", client);

    EXPECT_TRUE(registry.unsubscribeProgress("t-1", client));
    EXPECT_FALSE(registry.unsubscribeProgress("t-1", client));

    // Сессия не terminal, запись остаётся
    EXPECT_TRUE(registry.contains("t-1"));
    EXPECT_FALSE(registry.releaseTransfer("t-1"));
}

TEST_F(SessionRegistryTest, TerminalEntryReleasedWithLastSubscriber) {
    auto a = std::make_shared<RecordingSubscriber>("a");
    auto b = std::make_shared<RecordingSubscriber>("b");
    auto session = registry.subscribeProgress("t-1", a);
    registry.subscribeProgress("t-1", b);

    session->markCompleted();
    EXPECT_TRUE(registry.unsubscribeProgress("t-1", a));
    EXPECT_TRUE(registry.contains("t-1"));

    EXPECT_TRUE(registry.unsubscribeProgress("t-1", b));
    EXPECT_FALSE(registry.contains("t-1"));
    EXPECT_EQ(registry.find("t-1"), nullptr);
}

TEST_F(SessionRegistryTest, SweepRemovesOnlyIdleTerminalEntries) {
    registry.getOrCreate("done")->markCompleted();
    registry.getOrCreate("failed")->markFailed("boom");
    registry.getOrCreate("active")->reportProgress(10.0);

    auto watcher = std::make_shared<RecordingSubscriber>("w");
    registry.subscribeProgress("watched", watcher)->markCompleted();

    EXPECT_EQ(registry.sweepIdle(), 2u);
    EXPECT_TRUE(registry.contains("active"));
    EXPECT_TRUE(registry.contains("watched"));
    EXPECT_FALSE(registry.contains("done"));
    EXPECT_FALSE(registry.contains("failed"));
}

TEST_F(SessionRegistryTest, DeadSubscriberDropped) {
    auto dead = std::make_shared<RecordingSubscriber>("dead", false);
    auto alive = std::make_shared<RecordingSubscriber>("alive");
    registry.subscribeProgress("t-1", dead);
    registry.subscribeProgress("t-1", alive);

    EXPECT_TRUE(eventually([&] { return registry.subscriberCount("t-1") == 1; }));
    EXPECT_TRUE(dead->closed());
    EXPECT_FALSE(alive->closed());
    EXPECT_TRUE(registry.contains("t-1"));

    // Последний подписчик отвалился после завершения: запись уходит сама
    alive->setAlive(false);
    registry.find("t-1")->markCompleted();
    EXPECT_TRUE(eventually([&] { return !registry.contains("t-1"); }));
}

TEST_F(SessionRegistryTest, ThrowingSubscriberDropped) {
    auto broken = std::make_shared<ThrowingSubscriber>("broken");
    registry.subscribeProgress("t-1", broken);
    EXPECT_TRUE(eventually([&] { return registry.subscriberCount("t-1") == 0; }));
}

// ═══════════════════════════════════════════════════════════
// Освобождение terminal-записей
// ═══════════════════════════════════════════════════════════

TEST_F(SessionRegistryTest, DroppedSubscriberOfFinishedTransferReleasesEntry) {
    registry.getOrCreate("t-1")->markCompleted();
    auto dead = std::make_shared<RecordingSubscriber>("dead", false);
    registry.subscribeProgress("t-1", dead);

    EXPECT_TRUE(eventually([&] { return !registry.contains("t-1"); }));
    EXPECT_TRUE(dead->closed());
}

TEST_F(SessionRegistryTest, CompletionAfterLastUnsubscribeReleasesEntry) {
    auto client = std::make_shared<RecordingSubscriber>("c-1");
    auto session = registry.subscribeProgress("t-1", client);
    std::weak_ptr<TransferSession> weak = session;

    EXPECT_TRUE(registry.unsubscribeProgress("t-1", client));
    EXPECT_TRUE(registry.contains("t-1"));

    session->markCompleted();
    EXPECT_FALSE(registry.contains("t-1"));
    EXPECT_EQ(registry.find("t-1"), nullptr);

    // Реестр больше не держит сессию
    session.reset();
    EXPECT_TRUE(weak.expired());
}

TEST_F(SessionRegistryTest, CancelPlaceholderKeptWithinRetention) {
    registry.requestCancel("ghost");
    registry.getOrCreate("other");

    EXPECT_TRUE(registry.contains("ghost"));
    EXPECT_EQ(registry.sweepExpired(), 0u);
    EXPECT_TRUE(registry.contains("ghost"));
}

TEST_F(SessionRegistryTest, ExpiredPlaceholderSweptOnNewTransfer) {
    SessionRegistry shortLived{std::chrono::milliseconds(20), std::chrono::milliseconds(0)};
    shortLived.requestCancel("ghost");
    EXPECT_TRUE(shortLived.contains("ghost"));

    shortLived.getOrCreate("other");
    EXPECT_FALSE(shortLived.contains("ghost"));
    EXPECT_TRUE(shortLived.contains("other"));
}

TEST_F(SessionRegistryTest, SweepExpiredHonorsRetention) {
    registry.requestCancel("ghost");
    registry.getOrCreate("active")->reportProgress(5.0);

    auto later = std::chrono::steady_clock::now() + DEFAULT_IDLE_RETENTION + std::chrono::seconds(1);
    EXPECT_EQ(registry.sweepExpired(later), 1u);
    EXPECT_FALSE(registry.contains("ghost"));
    EXPECT_TRUE(registry.contains("active"));
}

TEST_F(SessionRegistryTest, RegistryFromConfig) {
    ServiceConfig config;
    config.idleRetentionSec = 0;
    SessionRegistry configured(config);

    configured.requestCancel("ghost");
    EXPECT_EQ(configured.sweepExpired(), 1u);
    EXPECT_EQ(configured.transferCount(), 0u);
}

// ═══════════════════════════════════════════════════════════
// Отмена
// ═══════════════════════════════════════════════════════════

TEST_F(SessionRegistryTest, CancelIsIdempotent) {
    auto session = registry.getOrCreate("t-1");
    session->reportProgress(20.0);

    EXPECT_TRUE(registry.requestCancel("t-1"));
    EXPECT_FALSE(registry.requestCancel("t-1"));
    EXPECT_EQ(session->state(), TransferState::Canceled);
    EXPECT_TRUE(session->isCancelRequested());
}

TEST_F(SessionRegistryTest, CancelBeforeTransferStarts) {
    EXPECT_TRUE(registry.requestCancel("future"));

    // Передача, стартующая позже, сразу видит отмену
    auto session = registry.getOrCreate("future");
    EXPECT_FALSE(session->recordChunk(100));
    EXPECT_EQ(session->state(), TransferState::Canceled);
}

TEST_F(SessionRegistryTest, CancelAfterCompletionIsNoOp) {
    auto session = registry.getOrCreate("t-1");
    session->markCompleted();
    registry.requestCancel("t-1");
    EXPECT_EQ(session->state(), TransferState::Completed);
}

TEST_F(SessionRegistryTest, SubscribersSeeCancellation) {
    auto client = std::make_shared<RecordingSubscriber>("c-1");
    registry.subscribeProgress("t-1", client);
    registry.requestCancel("t-1");

    EXPECT_TRUE(client->waitFor([](const std::string& m) {
        auto snap = TransferSnapshot::fromJson(m);
        return snap && snap->canceled && !snap->completed;
    }));
}

// ═══════════════════════════════════════════════════════════
// Presence
// ═══════════════════════════════════════════════════════════

TEST_F(SessionRegistryTest, PresenceRegistration) {
    auto conn = std::make_shared<RecordingSubscriber>("conn-1");
    EXPECT_EQ(registry.registerPresence("alice", conn), PresenceResult::Success);
    EXPECT_EQ(registry.registerPresence("alice", std::make_shared<RecordingSubscriber>("conn-2")),
              PresenceResult::AlreadyConnected);
    EXPECT_EQ(registry.registerPresence("", conn), PresenceResult::InvalidArgument);
    EXPECT_EQ(registry.registerPresence("bob", nullptr), PresenceResult::InvalidArgument);

    EXPECT_EQ(registry.presenceConnection("alice"), conn);
}

TEST_F(SessionRegistryTest, PresenceSnapshotSorted) {
    registry.registerPresence("carol", std::make_shared<RecordingSubscriber>("1"));
    registry.registerPresence("alice", std::make_shared<RecordingSubscriber>("2"));
    registry.registerPresence("bob", std::make_shared<RecordingSubscriber>("3"));

    std::vector<std::string> expected = {"alice", "bob", "carol"};
    EXPECT_EQ(registry.presenceSnapshot(), expected);
    EXPECT_EQ(registry.presenceConnections().size(), 3u);
}

TEST_F(SessionRegistryTest, UnregisterRequiresSameConnection) {
    auto original = std::make_shared<RecordingSubscriber>("orig");
    auto stranger = std::make_shared<RecordingSubscriber>("other");
    registry.registerPresence("alice", original);

    EXPECT_FALSE(registry.unregisterPresence("alice", stranger));
    EXPECT_TRUE(registry.unregisterPresence("alice", original));
    EXPECT_EQ(registry.presenceConnection("alice"), nullptr);
    EXPECT_FALSE(registry.unregisterPresence("alice", original));
}
