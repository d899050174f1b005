#include <gtest/gtest.h>
#include "message_sync_worker.hpp"
#include "sqlite_outbox_store.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>

using namespace tether;

namespace {

class FakeKeys : public SessionKeyProvider {
public:
    SecureBytes session_key(const std::string& session_id) override {
        if (unsealable.count(session_id)) {
            throw SecretError(SecretErrorCode::SessionNotFound, "no grant for session " + session_id);
        }
        auto it = keys.find(session_id);
        if (it == keys.end()) it = keys.emplace(session_id, Crypto::random_key()).first;
        return it->second;
    }

    std::map<std::string, SecureBytes> keys;
    std::set<std::string> unsealable;
};

// Behaves like the cloud store: deduplicates by eventId.
class FakeCloud : public CloudSyncEndpoint {
public:
    BatchReceipt send_batch(const std::vector<EncryptedEnvelope>& envelopes) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++calls;
        if (fail) throw std::runtime_error("network unreachable");
        BatchReceipt receipt;
        for (const auto& env : envelopes) {
            if (stored.emplace(env.event_id, env).second) {
                ++receipt.accepted;
            } else {
                ++receipt.duplicates;
            }
        }
        batches.push_back(envelopes);
        return receipt;
    }

    std::mutex mutex;
    std::map<std::string, EncryptedEnvelope> stored;
    std::vector<std::vector<EncryptedEnvelope>> batches;
    int calls = 0;
    bool fail = false;
};

SyncMessage message(const std::string& session, const std::string& body, const std::string& event_id = "") {
    SyncMessage msg;
    msg.session_id = session;
    msg.channel = Channel::Conversation;
    msg.body = body;
    msg.event_id = event_id;
    return msg;
}

}

class MessageSyncWorkerTest : public ::testing::Test {
protected:
    static SyncWorkerConfig make_config() {
        SyncWorkerConfig c;
        c.batch_size = 50;
        c.flush_interval = std::chrono::milliseconds(50);
        return c;
    }

    void sign_in() { worker.set_context({"alice", "laptop"}); }

    SyncWorkerConfig config = make_config();
    SqliteOutboxStore outbox{":memory:"};
    FakeCloud cloud;
    FakeKeys keys;
    MessageSyncWorker worker{config, outbox, cloud, keys};
};

TEST_F(MessageSyncWorkerTest, EnqueueFillsIdentity) {
    sign_in();
    auto id = worker.enqueue(message("s1", "one"));
    EXPECT_FALSE(id.empty());
    EXPECT_EQ(worker.buffered(), 1u);

    auto report = worker.flush_now();
    EXPECT_EQ(report.sent, 1u);
    ASSERT_EQ(cloud.stored.count(id), 1u);
    const auto& env = cloud.stored.at(id);
    EXPECT_EQ(env.sender_device_id, "laptop");
    EXPECT_EQ(env.sequence_number, 1);
    EXPECT_GT(env.created_at, 0);
    EXPECT_EQ(open_envelope(env, keys.keys.at("s1")), "one");
    EXPECT_EQ(outbox.count(), 0u);
}

TEST_F(MessageSyncWorkerTest, EnqueueRequiresSessionAndSender) {
    EXPECT_THROW(worker.enqueue(message("", "x")), std::invalid_argument);
    // No context and no explicit sender.
    EXPECT_THROW(worker.enqueue(message("s1", "x")), std::invalid_argument);
}

TEST_F(MessageSyncWorkerTest, SequenceNumbersIncreasePerSession) {
    sign_in();
    for (int i = 0; i < 3; ++i) worker.enqueue(message("s1", "a"));
    for (int i = 0; i < 2; ++i) worker.enqueue(message("s2", "b"));
    worker.flush_now();

    ASSERT_EQ(cloud.batches.size(), 1u);
    std::map<std::string, std::vector<int64_t>> seqs;
    for (const auto& env : cloud.batches[0]) seqs[env.session_id].push_back(env.sequence_number);
    EXPECT_EQ(seqs["s1"], (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(seqs["s2"], (std::vector<int64_t>{1, 2}));

    worker.enqueue(message("s1", "later"));
    worker.flush_now();
    EXPECT_EQ(cloud.batches.back().front().sequence_number, 4);
}

TEST_F(MessageSyncWorkerTest, NoContextSkipsFlush) {
    SyncMessage msg = message("s1", "x");
    msg.sender_device_id = "laptop";
    worker.enqueue(msg);

    auto report = worker.flush_now();
    EXPECT_TRUE(report.skipped);
    EXPECT_EQ(cloud.calls, 0);
    EXPECT_EQ(worker.buffered(), 1u);
    EXPECT_EQ(outbox.count(), 0u);

    sign_in();
    EXPECT_EQ(worker.flush_now().sent, 1u);
}

TEST_F(MessageSyncWorkerTest, OneUnsealableMessageDoesNotBlockTheBatch) {
    sign_in();
    keys.unsealable.insert("s-broken");

    std::string broken_id;
    for (int i = 1; i <= 50; ++i) {
        if (i == 7) {
            broken_id = worker.enqueue(message("s-broken", "seven"));
        } else {
            worker.enqueue(message("s1", "msg " + std::to_string(i)));
        }
    }

    auto report = worker.flush_now();
    EXPECT_EQ(report.sent, 49u);
    EXPECT_EQ(report.encryption_failures, 1u);
    EXPECT_EQ(cloud.calls, 1);
    EXPECT_EQ(cloud.stored.size(), 49u);

    auto failed = outbox.get(broken_id);
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, OutboxStatus::Failed);
    EXPECT_EQ(failed->sync_attempts, 1);
    EXPECT_NE(failed->last_error.find("encryption"), std::string::npos);
    EXPECT_EQ(outbox.count(), 1u);
}

TEST_F(MessageSyncWorkerTest, NetworkFailureKeepsMessagesForRetry) {
    sign_in();
    cloud.fail = true;
    auto id = worker.enqueue(message("s1", "x"));

    auto report = worker.flush_now();
    EXPECT_EQ(report.network_failures, 1u);
    EXPECT_EQ(worker.buffered(), 0u);

    auto row = outbox.get(id);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->status, OutboxStatus::Pending);
    EXPECT_EQ(row->sync_attempts, 1);
    ASSERT_TRUE(row->envelope.has_value());
    EXPECT_TRUE(row->message.body.empty());

    // Not due yet: the backoff puts it two seconds out.
    cloud.fail = false;
    worker.flush_now();
    EXPECT_EQ(cloud.stored.size(), 0u);
    EXPECT_EQ(outbox.count(), 1u);
}

TEST_F(MessageSyncWorkerTest, RetryResendsIdenticalCiphertext) {
    sign_in();
    cloud.fail = true;
    auto id = worker.enqueue(message("s1", "x"));
    worker.flush_now();
    auto sealed = outbox.get(id)->envelope;
    ASSERT_TRUE(sealed.has_value());

    // Make it due now.
    auto row = *outbox.get(id);
    row.next_retry_at = 0;
    outbox.upsert_batch({row});

    cloud.fail = false;
    auto report = worker.flush_now();
    EXPECT_EQ(report.sent, 1u);
    EXPECT_EQ(report.backfilled, 1u);
    EXPECT_EQ(cloud.stored.at(id).nonce, sealed->nonce);
    EXPECT_EQ(cloud.stored.at(id).ciphertext, sealed->ciphertext);
    EXPECT_EQ(outbox.count(), 0u);
}

TEST_F(MessageSyncWorkerTest, FutureRetryIsNotBackfilled) {
    sign_in();
    OutboxEntry later;
    later.message = message("s1", "later", "evt-later");
    later.message.sender_device_id = "laptop";
    later.message.sequence_number = 1;
    later.message.created_at = 1;
    later.next_retry_at = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count() + 60000;
    outbox.upsert_batch({later});

    auto report = worker.flush_now();
    EXPECT_EQ(report.backfilled, 0u);
    EXPECT_EQ(cloud.calls, 0);
    EXPECT_EQ(outbox.count(), 1u);
}

TEST_F(MessageSyncWorkerTest, DuplicateEventIdIsIdempotent) {
    sign_in();
    worker.enqueue(message("s1", "x", "evt-1"));
    worker.enqueue(message("s1", "x", "evt-1"));
    EXPECT_EQ(worker.buffered(), 1u);
    worker.flush_now();

    // Resent after confirmation: the cloud reports a duplicate and nothing is stored twice.
    worker.enqueue(message("s1", "x", "evt-1"));
    EXPECT_EQ(worker.flush_now().sent, 1u);
    EXPECT_EQ(cloud.stored.size(), 1u);
    EXPECT_EQ(outbox.count(), 0u);
}

TEST_F(MessageSyncWorkerTest, StopPersistsBufferedMessages) {
    SyncMessage msg = message("s1", "unsent");
    msg.sender_device_id = "laptop";
    auto id = worker.enqueue(msg);

    worker.stop();
    EXPECT_EQ(worker.buffered(), 0u);
    auto row = outbox.get(id);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->status, OutboxStatus::Pending);
    EXPECT_EQ(row->message.body, "unsent");
    EXPECT_EQ(cloud.calls, 0);
}

TEST_F(MessageSyncWorkerTest, SequenceContinuesFromOutbox) {
    OutboxEntry old;
    old.message = message("s1", "old", "evt-old");
    old.message.sender_device_id = "laptop";
    old.message.sequence_number = 41;
    old.message.created_at = 1;
    old.status = OutboxStatus::Failed;
    outbox.upsert_batch({old});

    sign_in();
    worker.enqueue(message("s1", "new"));
    worker.flush_now();
    ASSERT_EQ(cloud.batches.size(), 1u);
    EXPECT_EQ(cloud.batches[0][0].sequence_number, 42);
}

TEST_F(MessageSyncWorkerTest, SequenceSurvivesRestartAfterDirectSend) {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() /
                          ("tether_outbox_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                           "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".db");
    {
        SqliteOutboxStore store(path.string());
        MessageSyncWorker first(config, store, cloud, keys);
        first.set_context({"alice", "laptop"});
        first.enqueue(message("s1", "before restart"));
        ASSERT_EQ(first.flush_now().sent, 1u);
        EXPECT_EQ(store.count(), 0u);
        first.stop();
    }
    {
        SqliteOutboxStore store(path.string());
        MessageSyncWorker second(config, store, cloud, keys);
        second.set_context({"alice", "laptop"});
        second.enqueue(message("s1", "after restart"));
        ASSERT_EQ(second.flush_now().sent, 1u);
        second.stop();
    }
    std::error_code ec;
    fs::remove(path, ec);

    ASSERT_EQ(cloud.batches.size(), 2u);
    EXPECT_EQ(cloud.batches[0][0].sequence_number, 1);
    EXPECT_EQ(cloud.batches[1][0].sequence_number, 2);
}

TEST_F(MessageSyncWorkerTest, RetryFailedRequeues) {
    sign_in();
    keys.unsealable.insert("s1");
    auto id = worker.enqueue(message("s1", "x"));
    worker.flush_now();
    ASSERT_EQ(outbox.get(id)->status, OutboxStatus::Failed);

    EXPECT_FALSE(worker.retry_failed("unknown"));
    keys.unsealable.clear();
    // The body was never sealed, so the retry can seal it now.
    EXPECT_TRUE(worker.retry_failed(id));
    EXPECT_EQ(worker.flush_now().sent, 1u);
    EXPECT_EQ(outbox.count(), 0u);
}

TEST_F(MessageSyncWorkerTest, BackgroundThreadFlushesOnInterval) {
    sign_in();
    worker.start();
    worker.enqueue(message("s1", "bg"));

    for (int i = 0; i < 100; ++i) {
        {
            std::lock_guard<std::mutex> lock(cloud.mutex);
            if (!cloud.stored.empty()) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    worker.stop();

    std::lock_guard<std::mutex> lock(cloud.mutex);
    EXPECT_EQ(cloud.stored.size(), 1u);
}
