#include "outbox_store.hpp"

#include <algorithm>

namespace tether {

const char* outbox_status_name(OutboxStatus status) {
    switch (status) {
        case OutboxStatus::Pending: return "pending";
        case OutboxStatus::Sent: return "sent";
        case OutboxStatus::Failed: return "failed";
    }
    return "pending";
}

OutboxStatus parse_outbox_status(const std::string& name) {
    if (name == "sent") return OutboxStatus::Sent;
    if (name == "failed") return OutboxStatus::Failed;
    return OutboxStatus::Pending;
}

std::chrono::seconds compute_backoff(int attempts, const SyncWorkerConfig& config) {
    if (attempts <= 0) return std::chrono::seconds(0);

    const long long base = std::max<long long>(0, config.backoff_base.count());
    const long long cap = std::max<long long>(0, config.backoff_max.count());
    if (config.backoff_steps > 0 && attempts > config.backoff_steps) return std::chrono::seconds(cap);

    // Doubling stops at the cap, so large attempt counts cannot overflow.
    long long delay = std::min(base, cap);
    for (int i = 1; i < attempts && delay < cap; ++i) {
        delay = std::min(delay * 2, cap);
    }
    return std::chrono::seconds(delay);
}

OutboxEntry advance_outbox_entry(OutboxEntry entry, const SyncOutcome& outcome, int64_t now_ms,
                                 const SyncWorkerConfig& config) {
    switch (outcome.kind) {
        case SyncOutcomeKind::Sent:
            entry.status = OutboxStatus::Sent;
            entry.last_error.clear();
            break;

        case SyncOutcomeKind::NetworkFailure: {
            entry.sync_attempts += 1;
            auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
                compute_backoff(entry.sync_attempts, config));
            entry.next_retry_at = now_ms + delay.count();
            entry.last_error = outcome.error;
            entry.status = (config.max_retries > 0 && entry.sync_attempts >= config.max_retries)
                               ? OutboxStatus::Failed
                               : OutboxStatus::Pending;
            break;
        }

        case SyncOutcomeKind::EncryptionFailure:
            entry.sync_attempts += 1;
            entry.next_retry_at = now_ms;
            entry.last_error = "encryption: " + outcome.error;
            entry.status = OutboxStatus::Failed;
            break;
    }
    return entry;
}

}
