#pragma once

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <set>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <optional>
#include <chrono>

#include "outbox_store.hpp"
#include "secret_distributor.hpp"
#include "server_config.hpp"

namespace tether {

struct BatchReceipt {
    size_t accepted = 0;
    size_t duplicates = 0;
};

// Remote durable store for sealed envelopes.
class CloudSyncEndpoint {
public:
    virtual ~CloudSyncEndpoint() = default;

    /**
     * One network call for the whole batch. The store deduplicates by eventId.
     * Throws on a transport failure or a rejected batch.
     */
    virtual BatchReceipt send_batch(const std::vector<EncryptedEnvelope>& envelopes) = 0;
};

// Signed-in identity the worker syncs on behalf of.
struct SyncContext {
    std::string user_id;
    std::string device_id;
};

// Strictly increasing sequence numbers per (session, sender), seeded from the
// outbox the first time a pair is seen.
class SequenceAllocator {
public:
    explicit SequenceAllocator(OutboxStore& outbox) : outbox_(outbox) {}

    int64_t next(const std::string& session_id, const std::string& sender_device_id);

    // Records an externally assigned number so later allocations stay above it.
    void observe(const std::string& session_id, const std::string& sender_device_id, int64_t sequence);

private:
    int64_t& slot(const std::string& session_id, const std::string& sender_device_id);

    OutboxStore& outbox_;
    std::map<std::pair<std::string, std::string>, int64_t> last_;
    std::mutex mutex_;
};

struct FlushReport {
    bool skipped = false;        // no auth context
    size_t sent = 0;
    size_t encryption_failures = 0;
    size_t network_failures = 0; // messages written back to the outbox for retry
    size_t backfilled = 0;
};

/**
 * Batches locally produced messages, seals them with the session key and pushes
 * them to the cloud store. Anything that cannot be confirmed is kept in the
 * outbox and retried with backoff.
 */
class MessageSyncWorker {
public:
    MessageSyncWorker(SyncWorkerConfig config, OutboxStore& outbox, CloudSyncEndpoint& endpoint,
                      SessionKeyProvider& keys);
    ~MessageSyncWorker();

    MessageSyncWorker(const MessageSyncWorker&) = delete;
    MessageSyncWorker& operator=(const MessageSyncWorker&) = delete;

    void start();

    // Halts the background thread. Buffered messages are persisted as pending.
    void stop();

    /**
     * Buffers a message without blocking on the network. Missing eventId,
     * createdAt, sender and sequence number are filled in.
     * @return the message's eventId.
     */
    std::string enqueue(SyncMessage message);

    // Reserves a sequence number for a message that is also sent live before enqueue().
    int64_t next_sequence(const std::string& session_id, const std::string& sender_device_id) {
        return sequences_.next(session_id, sender_device_id);
    }

    void set_context(const SyncContext& context);
    void clear_context();
    bool has_context() const;

    // Runs one flush on the calling thread.
    FlushReport flush_now();

    // Operator force-retry of a failed outbox entry.
    bool retry_failed(const std::string& event_id);

    size_t buffered() const;

private:
    using Clock = std::chrono::steady_clock;

    void run();
    FlushReport flush_once();
    std::vector<OutboxEntry> take_batch(size_t limit);
    void restore(std::vector<OutboxEntry> fresh);
    bool seal(OutboxEntry& entry, std::string& error);

    SyncWorkerConfig config_;
    OutboxStore& outbox_;
    CloudSyncEndpoint& endpoint_;
    SessionKeyProvider& keys_;
    SequenceAllocator sequences_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SyncMessage> buffer_;
    std::set<std::string> buffered_ids_;
    Clock::time_point oldest_enqueued_{};
    Clock::time_point last_flush_{};
    std::optional<SyncContext> context_;
    bool flush_requested_ = false;

    std::mutex flush_mutex_;  // one flush at a time
    std::atomic<bool> running_{false};
    std::thread thread_;
};

}
