#include "message_sync_worker.hpp"
#include "logger.hpp"
#include "metrics.hpp"

#include <algorithm>
#include <stdexcept>

namespace tether {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}

// --- SequenceAllocator ---

int64_t& SequenceAllocator::slot(const std::string& session_id, const std::string& sender_device_id) {
    auto key = std::make_pair(session_id, sender_device_id);
    auto it = last_.find(key);
    if (it == last_.end()) {
        it = last_.emplace(key, outbox_.max_sequence(session_id, sender_device_id)).first;
    }
    return it->second;
}

int64_t SequenceAllocator::next(const std::string& session_id, const std::string& sender_device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++slot(session_id, sender_device_id);
}

void SequenceAllocator::observe(const std::string& session_id, const std::string& sender_device_id,
                                int64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& last = slot(session_id, sender_device_id);
    last = std::max(last, sequence);
}

// --- MessageSyncWorker ---

MessageSyncWorker::MessageSyncWorker(SyncWorkerConfig config, OutboxStore& outbox, CloudSyncEndpoint& endpoint,
                                     SessionKeyProvider& keys)
    : config_(std::move(config)), outbox_(outbox), endpoint_(endpoint), keys_(keys), sequences_(outbox) {
    if (config_.batch_size == 0) config_.batch_size = 1;
}

MessageSyncWorker::~MessageSyncWorker() {
    stop();
}

void MessageSyncWorker::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]() { run(); });
    Logger::log(Logger::Level::INFO, Logger::EventType::SYNC, "worker", "Message sync worker started");
}

void MessageSyncWorker::stop() {
    if (running_.exchange(false)) {
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
        Logger::log(Logger::Level::INFO, Logger::EventType::SYNC, "worker", "Message sync worker stopped");
    }

    std::vector<OutboxEntry> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& message : buffer_) {
            OutboxEntry entry;
            entry.message = std::move(message);
            entry.next_retry_at = now_ms();
            leftovers.push_back(std::move(entry));
        }
        buffer_.clear();
        buffered_ids_.clear();
    }
    if (leftovers.empty()) return;

    try {
        outbox_.upsert_batch(leftovers);
        Logger::log(Logger::Level::INFO, Logger::EventType::SYNC, "worker",
                    "Persisted " + std::to_string(leftovers.size()) + " buffered message(s) to the outbox");
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::CRITICAL, Logger::EventType::SYNC, "worker",
                    std::string("Could not persist buffered messages: ") + e.what());
    }
}

std::string MessageSyncWorker::enqueue(SyncMessage message) {
    if (message.session_id.empty()) {
        throw std::invalid_argument("message has no session id");
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (message.sender_device_id.empty() && context_) {
        message.sender_device_id = context_->device_id;
    }
    if (message.sender_device_id.empty()) {
        throw std::invalid_argument("message has no sender device");
    }
    if (message.event_id.empty()) {
        message.event_id = Crypto::uuid_v7();
    }
    if (buffered_ids_.count(message.event_id)) {
        return message.event_id;
    }
    lock.unlock();

    if (message.sequence_number <= 0) {
        message.sequence_number = sequences_.next(message.session_id, message.sender_device_id);
    } else {
        sequences_.observe(message.session_id, message.sender_device_id, message.sequence_number);
    }
    if (message.created_at <= 0) {
        message.created_at = now_ms();
    }

    std::string event_id = message.event_id;
    bool wake = false;
    lock.lock();
    if (!buffered_ids_.insert(event_id).second) {
        return event_id;
    }
    if (buffer_.empty()) {
        oldest_enqueued_ = Clock::now();
    }
    buffer_.push_back(std::move(message));
    wake = buffer_.size() >= config_.batch_size;
    MetricsRegistry::instance().set_gauge("tether_sync_buffered", static_cast<double>(buffer_.size()));
    lock.unlock();

    if (wake) cv_.notify_one();
    return event_id;
}

void MessageSyncWorker::set_context(const SyncContext& context) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        context_ = context;
        flush_requested_ = true;
    }
    cv_.notify_one();
}

void MessageSyncWorker::clear_context() {
    std::lock_guard<std::mutex> lock(mutex_);
    context_.reset();
}

bool MessageSyncWorker::has_context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return context_.has_value();
}

size_t MessageSyncWorker::buffered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
}

bool MessageSyncWorker::retry_failed(const std::string& event_id) {
    bool reset = outbox_.retry_failed(event_id, now_ms());
    if (reset) {
        Logger::log(Logger::Level::INFO, Logger::EventType::SYNC, event_id, "Failed outbox entry queued for retry");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            flush_requested_ = true;
        }
        cv_.notify_one();
    }
    return reset;
}

void MessageSyncWorker::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        auto deadline = buffer_.empty()
                            ? Clock::now() + config_.flush_interval
                            : std::max(oldest_enqueued_, last_flush_) + config_.flush_interval;

        cv_.wait_until(lock, deadline, [this]() {
            return !running_ || flush_requested_ || (context_ && buffer_.size() >= config_.batch_size);
        });
        if (!running_) break;

        flush_requested_ = false;
        lock.unlock();
        try {
            flush_once();
        } catch (const std::exception& e) {
            Logger::log(Logger::Level::ERROR, Logger::EventType::SYNC, "worker",
                        std::string("Flush failed: ") + e.what());
        }
        lock.lock();
        last_flush_ = Clock::now();
    }
}

FlushReport MessageSyncWorker::flush_now() {
    return flush_once();
}

std::vector<OutboxEntry> MessageSyncWorker::take_batch(size_t limit) {
    std::vector<OutboxEntry> fresh;
    std::lock_guard<std::mutex> lock(mutex_);
    while (!buffer_.empty() && fresh.size() < limit) {
        OutboxEntry entry;
        entry.message = std::move(buffer_.front());
        buffer_.pop_front();
        buffered_ids_.erase(entry.event_id());
        fresh.push_back(std::move(entry));
    }
    if (!buffer_.empty()) oldest_enqueued_ = Clock::now();
    MetricsRegistry::instance().set_gauge("tether_sync_buffered", static_cast<double>(buffer_.size()));
    return fresh;
}

// Puts unconfirmed fresh messages back at the head of the buffer.
void MessageSyncWorker::restore(std::vector<OutboxEntry> fresh) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = fresh.rbegin(); it != fresh.rend(); ++it) {
        if (buffered_ids_.insert(it->event_id()).second) {
            buffer_.push_front(std::move(it->message));
        }
    }
    oldest_enqueued_ = Clock::now();
}

bool MessageSyncWorker::seal(OutboxEntry& entry, std::string& error) {
    if (entry.envelope) return true;

    const auto& msg = entry.message;
    try {
        SecureBytes key = keys_.session_key(msg.session_id);

        EncryptedEnvelope header;
        header.session_id = msg.session_id;
        header.channel = msg.channel;
        header.event_id = msg.event_id;
        header.sequence_number = msg.sequence_number;
        header.sender_device_id = msg.sender_device_id;
        header.created_at = msg.created_at;
        entry.envelope = seal_envelope(std::move(header), msg.body, key);
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

FlushReport MessageSyncWorker::flush_once() {
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);
    FlushReport report;

    if (!has_context()) {
        // Not signed in yet: buffer and outbox stay as they are.
        report.skipped = true;
        return report;
    }

    std::vector<OutboxEntry> fresh = take_batch(config_.batch_size);
    std::set<std::string> fresh_ids;
    for (const auto& entry : fresh) fresh_ids.insert(entry.event_id());
    const int64_t now = now_ms();

    std::vector<OutboxEntry> batch = std::move(fresh);
    if (batch.size() < config_.batch_size) {
        std::vector<OutboxEntry> due;
        try {
            due = outbox_.due(now, config_.batch_size - batch.size());
        } catch (const std::exception& e) {
            Logger::log(Logger::Level::ERROR, Logger::EventType::SYNC, "outbox",
                        std::string("Backfill read failed: ") + e.what());
        }
        for (auto& entry : due) {
            bool duplicate = std::any_of(batch.begin(), batch.end(), [&](const OutboxEntry& e) {
                return e.event_id() == entry.event_id();
            });
            if (duplicate) continue;
            batch.push_back(std::move(entry));
            ++report.backfilled;
        }
    }
    if (batch.empty()) return report;

    std::stable_sort(batch.begin(), batch.end(), [](const OutboxEntry& a, const OutboxEntry& b) {
        if (a.message.session_id != b.message.session_id) return a.message.session_id < b.message.session_id;
        return a.message.sequence_number < b.message.sequence_number;
    });

    std::vector<OutboxEntry> sealed;
    std::vector<OutboxEntry> writes;
    for (auto& entry : batch) {
        std::string error;
        if (seal(entry, error)) {
            sealed.push_back(std::move(entry));
            continue;
        }
        Logger::log(Logger::Level::ERROR, Logger::EventType::SYNC, entry.event_id(),
                    "Sealing failed: " + error);
        writes.push_back(advance_outbox_entry(std::move(entry), {SyncOutcomeKind::EncryptionFailure, error},
                                              now, config_));
        ++report.encryption_failures;
    }

    std::vector<SyncMessage> confirmed;
    if (!sealed.empty()) {
        std::vector<EncryptedEnvelope> envelopes;
        envelopes.reserve(sealed.size());
        for (const auto& entry : sealed) envelopes.push_back(*entry.envelope);

        try {
            BatchReceipt receipt = endpoint_.send_batch(envelopes);
            for (const auto& entry : sealed) confirmed.push_back(entry.message);
            report.sent = sealed.size();
            MetricsRegistry::instance().increment_counter("tether_sync_batches_total");
            MetricsRegistry::instance().increment_counter("tether_sync_messages_total",
                                                          static_cast<double>(sealed.size()));
            MetricsRegistry::instance().observe("tether_sync_batch_size", static_cast<double>(sealed.size()));
            Logger::log(Logger::Level::DEBUG, Logger::EventType::SYNC, "worker",
                        "Batch confirmed: " + std::to_string(receipt.accepted) + " accepted, " +
                        std::to_string(receipt.duplicates) + " duplicate(s)");
        } catch (const std::exception& e) {
            MetricsRegistry::instance().increment_counter("tether_sync_failures_total");
            Logger::log(Logger::Level::WARNING, Logger::EventType::SYNC, "worker",
                        "Batch of " + std::to_string(sealed.size()) + " failed: " + e.what());
            for (auto& entry : sealed) {
                writes.push_back(advance_outbox_entry(std::move(entry), {SyncOutcomeKind::NetworkFailure, e.what()},
                                                      now, config_));
            }
            report.network_failures = writes.size() - report.encryption_failures;
        }
    }

    try {
        outbox_.remove(confirmed);
        outbox_.upsert_batch(writes);
    } catch (const std::exception& e) {
        Logger::log(Logger::Level::ERROR, Logger::EventType::SYNC, "outbox",
                    std::string("Recording batch outcome failed: ") + e.what());
        // Fresh messages exist nowhere else yet; keep them for the next flush.
        std::vector<OutboxEntry> unconfirmed;
        for (auto& entry : writes) {
            if (fresh_ids.count(entry.event_id())) unconfirmed.push_back(std::move(entry));
        }
        restore(std::move(unconfirmed));
    }

    if (report.encryption_failures > 0) {
        MetricsRegistry::instance().increment_counter("tether_sync_encryption_failures_total",
                                                      static_cast<double>(report.encryption_failures));
    }
    return report;
}

}
