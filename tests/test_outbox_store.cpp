#include <gtest/gtest.h>
#include "sqlite_outbox_store.hpp"

using namespace tether;

namespace {

OutboxEntry make_entry(const std::string& event_id, const std::string& session, int64_t seq,
                       int64_t next_retry_at = 0) {
    OutboxEntry entry;
    entry.message.event_id = event_id;
    entry.message.session_id = session;
    entry.message.channel = Channel::Communication;
    entry.message.sender_device_id = "dev-a";
    entry.message.sequence_number = seq;
    entry.message.created_at = 1000 + seq;
    entry.message.body = R"({"type":"OUTPUT_CHUNK"})";
    entry.next_retry_at = next_retry_at;
    return entry;
}

}

TEST(BackoffTest, DoublesThenPinsAtMax) {
    SyncWorkerConfig config;  // 2s base, 300s cap
    std::vector<long long> expected = {2, 4, 8, 16, 32, 64, 128, 300, 300, 300};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(compute_backoff(static_cast<int>(i) + 1, config).count(), expected[i]) << "attempt " << i + 1;
    }
    EXPECT_EQ(compute_backoff(0, config).count(), 0);
    EXPECT_EQ(compute_backoff(1000, config).count(), 300);
}

TEST(BackoffTest, SmallCapClampsWithoutSkippingSteps) {
    SyncWorkerConfig config;
    config.backoff_base = std::chrono::seconds(2);
    config.backoff_max = std::chrono::seconds(10);
    std::vector<long long> expected = {2, 4, 8, 10, 10};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(compute_backoff(static_cast<int>(i) + 1, config).count(), expected[i]) << "attempt " << i + 1;
    }

    config.backoff_base = std::chrono::seconds(1);
    config.backoff_max = std::chrono::seconds(60);
    expected = {1, 2, 4, 8, 16, 32, 60, 60};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(compute_backoff(static_cast<int>(i) + 1, config).count(), expected[i]) << "attempt " << i + 1;
    }
    EXPECT_EQ(compute_backoff(200, config).count(), 60);
}

TEST(BackoffTest, NetworkFailureSchedulesRetry) {
    SyncWorkerConfig config;
    config.max_retries = 3;

    auto entry = make_entry("e1", "s1", 1);
    entry = advance_outbox_entry(entry, {SyncOutcomeKind::NetworkFailure, "timeout"}, 10000, config);
    EXPECT_EQ(entry.status, OutboxStatus::Pending);
    EXPECT_EQ(entry.sync_attempts, 1);
    EXPECT_EQ(entry.next_retry_at, 12000);
    EXPECT_EQ(entry.last_error, "timeout");

    entry = advance_outbox_entry(entry, {SyncOutcomeKind::NetworkFailure, "timeout"}, 20000, config);
    EXPECT_EQ(entry.next_retry_at, 24000);
    entry = advance_outbox_entry(entry, {SyncOutcomeKind::NetworkFailure, "timeout"}, 30000, config);
    EXPECT_EQ(entry.status, OutboxStatus::Failed);
    EXPECT_EQ(entry.sync_attempts, 3);
}

TEST(BackoffTest, EncryptionFailureIsTerminal) {
    SyncWorkerConfig config;
    auto entry = advance_outbox_entry(make_entry("e1", "s1", 1), {SyncOutcomeKind::EncryptionFailure, "no key"},
                                      5000, config);
    EXPECT_EQ(entry.status, OutboxStatus::Failed);
    EXPECT_EQ(entry.sync_attempts, 1);
    EXPECT_NE(entry.last_error.find("no key"), std::string::npos);

    auto sent = advance_outbox_entry(entry, {SyncOutcomeKind::Sent, ""}, 6000, config);
    EXPECT_EQ(sent.status, OutboxStatus::Sent);
    EXPECT_TRUE(sent.last_error.empty());
}

class OutboxStoreTest : public ::testing::Test {
protected:
    SqliteOutboxStore store{":memory:"};
};

TEST_F(OutboxStoreTest, UpsertIsKeyedByEventId) {
    store.upsert_batch({make_entry("e1", "s1", 1), make_entry("e2", "s1", 2)});
    EXPECT_EQ(store.count(), 2u);

    auto updated = make_entry("e1", "s1", 1);
    updated.sync_attempts = 4;
    updated.last_error = "offline";
    store.upsert_batch({updated});
    EXPECT_EQ(store.count(), 2u);

    auto row = store.get("e1");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->sync_attempts, 4);
    EXPECT_EQ(row->last_error, "offline");
    EXPECT_EQ(row->message.channel, Channel::Communication);
    EXPECT_FALSE(store.get("nope").has_value());
}

TEST_F(OutboxStoreTest, SealedEntryDropsPlaintext) {
    auto entry = make_entry("e1", "s1", 1);
    EncryptedEnvelope env;
    env.session_id = "s1";
    env.channel = Channel::Communication;
    env.event_id = "e1";
    env.sequence_number = 1;
    env.sender_device_id = "dev-a";
    env.nonce = "AAAAAAAAAAAAAAAA";
    env.ciphertext = "Y2lwaGVy";
    entry.envelope = env;
    store.upsert_batch({entry});

    auto row = store.get("e1");
    ASSERT_TRUE(row.has_value());
    EXPECT_TRUE(row->message.body.empty());
    ASSERT_TRUE(row->envelope.has_value());
    EXPECT_EQ(row->envelope->ciphertext, "Y2lwaGVy");
}

TEST_F(OutboxStoreTest, DueHonoursRetryTimeAndStatus) {
    auto failed = make_entry("e3", "s1", 3);
    failed.status = OutboxStatus::Failed;
    store.upsert_batch({make_entry("e1", "s1", 1, 500), make_entry("e2", "s1", 2, 5000), failed});

    auto due = store.due(1000, 10);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].event_id(), "e1");

    EXPECT_EQ(store.due(10000, 10).size(), 2u);
    EXPECT_EQ(store.due(10000, 1).size(), 1u);
    EXPECT_TRUE(store.due(10000, 0).empty());
    EXPECT_EQ(store.list(OutboxStatus::Failed).size(), 1u);
}

TEST_F(OutboxStoreTest, RemoveIsIdempotent) {
    auto e1 = make_entry("e1", "s1", 1);
    store.upsert_batch({e1});
    store.remove({e1.message});
    store.remove({e1.message, make_entry("never-existed", "s1", 2).message});
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(OutboxStoreTest, MaxSequenceSurvivesRemoval) {
    EXPECT_EQ(store.max_sequence("s1", "dev-a"), 0);

    store.upsert_batch({make_entry("e1", "s1", 1), make_entry("e5", "s1", 5), make_entry("x9", "s2", 9)});
    EXPECT_EQ(store.max_sequence("s1", "dev-a"), 5);
    EXPECT_EQ(store.max_sequence("s2", "dev-a"), 9);
    EXPECT_EQ(store.max_sequence("s1", "dev-b"), 0);

    store.remove({make_entry("e1", "s1", 1).message, make_entry("e5", "s1", 5).message});
    EXPECT_EQ(store.max_sequence("s1", "dev-a"), 5);
}

TEST_F(OutboxStoreTest, ConfirmedMessageWithoutRowAdvancesCursor) {
    store.remove({make_entry("e1", "s1", 1).message, make_entry("e3", "s1", 3).message,
                  make_entry("e2", "s1", 2).message});
    EXPECT_EQ(store.count(), 0u);
    EXPECT_EQ(store.max_sequence("s1", "dev-a"), 3);
    EXPECT_EQ(store.max_sequence("s2", "dev-a"), 0);
}

TEST_F(OutboxStoreTest, RetryFailed) {
    auto failed = make_entry("e1", "s1", 1, 99999);
    failed.status = OutboxStatus::Failed;
    failed.sync_attempts = 20;
    store.upsert_batch({failed, make_entry("e2", "s1", 2)});

    EXPECT_FALSE(store.retry_failed("e2", 100));
    EXPECT_FALSE(store.retry_failed("missing", 100));
    EXPECT_TRUE(store.retry_failed("e1", 100));

    auto row = store.get("e1");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->status, OutboxStatus::Pending);
    EXPECT_EQ(row->sync_attempts, 0);
    EXPECT_EQ(store.due(100, 10).size(), 2u);
}
