#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

#include "envelope.hpp"
#include "server_config.hpp"

namespace tether {

// A locally produced event, before it is sealed.
struct SyncMessage {
    std::string event_id;          // assigned at enqueue when empty
    std::string session_id;
    Channel channel = Channel::Conversation;
    std::string sender_device_id;
    int64_t sequence_number = 0;   // assigned at enqueue when 0
    int64_t created_at = 0;        // ms since epoch
    std::string body;              // serialized plaintext event
};

enum class OutboxStatus {
    Pending,
    Sent,
    Failed
};

const char* outbox_status_name(OutboxStatus status);
OutboxStatus parse_outbox_status(const std::string& name);

// Durable record of a message that has not been confirmed by the cloud store.
// Once sealed, the envelope is kept so a retry resends identical ciphertext and
// the plaintext body is dropped.
struct OutboxEntry {
    SyncMessage message;
    std::optional<EncryptedEnvelope> envelope;
    int sync_attempts = 0;
    int64_t next_retry_at = 0;     // ms since epoch
    std::string last_error;
    OutboxStatus status = OutboxStatus::Pending;

    const std::string& event_id() const { return message.event_id; }
};

enum class SyncOutcomeKind {
    Sent,
    NetworkFailure,     // whole batch failed; retried with backoff
    EncryptionFailure   // this message only; not retried automatically
};

struct SyncOutcome {
    SyncOutcomeKind kind = SyncOutcomeKind::Sent;
    std::string error;
};

/**
 * Backoff for the given attempt count: min(base * 2^(attempts-1), max). Attempts
 * past backoff_steps get max directly; with the defaults that is 2,4,...,128
 * then 300. attempts <= 0 yields zero.
 */
std::chrono::seconds compute_backoff(int attempts, const SyncWorkerConfig& config);

// Pure retry-state transition applied after each sync attempt.
OutboxEntry advance_outbox_entry(OutboxEntry entry, const SyncOutcome& outcome, int64_t now_ms,
                                 const SyncWorkerConfig& config);

// Durable outbox keyed by eventId. Implementations must make remove() idempotent
// and apply each upsert_batch() atomically.
class OutboxStore {
public:
    virtual ~OutboxStore() = default;

    virtual void upsert_batch(const std::vector<OutboxEntry>& entries) = 0;
    // Deletes confirmed messages by eventId and advances the (session, sender)
    // sequence cursor from their numbers, whether or not a row was stored.
    virtual void remove(const std::vector<SyncMessage>& confirmed) = 0;

    virtual std::optional<OutboxEntry> get(const std::string& event_id) = 0;

    // Pending entries with next_retry_at <= now_ms, oldest-eligible first.
    virtual std::vector<OutboxEntry> due(int64_t now_ms, size_t limit) = 0;

    virtual std::vector<OutboxEntry> list(OutboxStatus status) = 0;
    virtual size_t count() = 0;

    // Highest sequence number queued or already confirmed for (session, sender); 0 if none.
    virtual int64_t max_sequence(const std::string& session_id, const std::string& sender_device_id) = 0;

    // Operator force-retry: failed -> pending, due immediately. false if not failed.
    virtual bool retry_failed(const std::string& event_id, int64_t now_ms) = 0;
};

}
