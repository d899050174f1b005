#pragma once

#include <string>
#include <mutex>

#include "outbox_store.hpp"
#include "sqlite_db.hpp"

namespace tether {

// SQLite-backed outbox. One row per eventId; the envelope column holds the sealed
// envelope as JSON once the message has been sealed.
class SqliteOutboxStore : public OutboxStore {
public:
    // ":memory:" gives a private in-process database.
    explicit SqliteOutboxStore(const std::string& path);

    void upsert_batch(const std::vector<OutboxEntry>& entries) override;
    void remove(const std::vector<SyncMessage>& confirmed) override;

    std::optional<OutboxEntry> get(const std::string& event_id) override;
    std::vector<OutboxEntry> due(int64_t now_ms, size_t limit) override;
    std::vector<OutboxEntry> list(OutboxStatus status) override;
    size_t count() override;

    int64_t max_sequence(const std::string& session_id, const std::string& sender_device_id) override;
    bool retry_failed(const std::string& event_id, int64_t now_ms) override;

private:
    void migrate();
    static OutboxEntry read_row(const SqliteStatement& stmt);

    SqliteDB db_;
    std::mutex mutex_;
};

}
