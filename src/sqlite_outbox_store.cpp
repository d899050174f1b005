#include "sqlite_outbox_store.hpp"
#include "input_validator.hpp"
#include "logger.hpp"

namespace tether {

namespace {

constexpr const char* SELECT_COLUMNS =
    "SELECT event_id, session_id, channel, sender_device_id, sequence_number, created_at, "
    "body, envelope, sync_attempts, next_retry_at, last_error, status FROM outbox ";

std::string select_sql(const char* tail) {
    return std::string(SELECT_COLUMNS) + tail;
}

}

SqliteOutboxStore::SqliteOutboxStore(const std::string& path) : db_(path) {
    migrate();
}

void SqliteOutboxStore::migrate() {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS outbox ("
        "  event_id TEXT PRIMARY KEY,"
        "  session_id TEXT NOT NULL,"
        "  channel TEXT NOT NULL,"
        "  sender_device_id TEXT NOT NULL,"
        "  sequence_number INTEGER NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  body TEXT,"
        "  envelope TEXT,"
        "  sync_attempts INTEGER NOT NULL DEFAULT 0,"
        "  next_retry_at INTEGER NOT NULL DEFAULT 0,"
        "  last_error TEXT NOT NULL DEFAULT '',"
        "  status TEXT NOT NULL DEFAULT 'pending'"
        ");");
    db_.exec("CREATE INDEX IF NOT EXISTS outbox_due_idx ON outbox(status, next_retry_at);");
    db_.exec("CREATE INDEX IF NOT EXISTS outbox_seq_idx ON outbox(session_id, sender_device_id, sequence_number);");
    db_.exec(
        "CREATE TABLE IF NOT EXISTS sync_cursor ("
        "  session_id TEXT NOT NULL,"
        "  sender_device_id TEXT NOT NULL,"
        "  last_synced_sequence INTEGER NOT NULL,"
        "  PRIMARY KEY (session_id, sender_device_id)"
        ");");
}

OutboxEntry SqliteOutboxStore::read_row(const SqliteStatement& stmt) {
    OutboxEntry entry;
    entry.message.event_id = stmt.column_text(0);
    entry.message.session_id = stmt.column_text(1);
    entry.message.channel = parse_channel(stmt.column_text(2)).value_or(Channel::Conversation);
    entry.message.sender_device_id = stmt.column_text(3);
    entry.message.sequence_number = stmt.column_int64(4);
    entry.message.created_at = stmt.column_int64(5);
    if (!stmt.column_is_null(6)) entry.message.body = stmt.column_text(6);

    if (!stmt.column_is_null(7)) {
        try {
            auto value = InputValidator::safe_parse_json(stmt.column_text(7));
            entry.envelope = envelope_from_json(value.as_object());
        } catch (const std::exception& e) {
            // The row stays readable; it will be resealed from its body if one exists.
            Logger::log(Logger::Level::ERROR, Logger::EventType::SYNC, entry.message.event_id,
                        std::string("Stored envelope is unreadable: ") + e.what());
        }
    }

    entry.sync_attempts = static_cast<int>(stmt.column_int64(8));
    entry.next_retry_at = stmt.column_int64(9);
    entry.last_error = stmt.column_text(10);
    entry.status = parse_outbox_status(stmt.column_text(11));
    return entry;
}

void SqliteOutboxStore::upsert_batch(const std::vector<OutboxEntry>& entries) {
    if (entries.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    SqliteTransaction tx(db_);
    SqliteStatement stmt(db_,
        "INSERT INTO outbox (event_id, session_id, channel, sender_device_id, sequence_number, created_at, "
        "body, envelope, sync_attempts, next_retry_at, last_error, status) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12) "
        "ON CONFLICT(event_id) DO UPDATE SET "
        "body = excluded.body, envelope = excluded.envelope, sync_attempts = excluded.sync_attempts, "
        "next_retry_at = excluded.next_retry_at, last_error = excluded.last_error, status = excluded.status;");

    for (const auto& entry : entries) {
        const auto& msg = entry.message;
        stmt.bind_text(1, msg.event_id);
        stmt.bind_text(2, msg.session_id);
        stmt.bind_text(3, channel_name(msg.channel));
        stmt.bind_text(4, msg.sender_device_id);
        stmt.bind_int64(5, msg.sequence_number);
        stmt.bind_int64(6, msg.created_at);

        // Plaintext is only kept until the message has been sealed.
        if (entry.envelope) {
            stmt.bind_null(7);
            stmt.bind_text(8, boost::json::serialize(envelope_to_json(*entry.envelope)));
        } else {
            stmt.bind_text(7, msg.body);
            stmt.bind_null(8);
        }

        stmt.bind_int64(9, entry.sync_attempts);
        stmt.bind_int64(10, entry.next_retry_at);
        stmt.bind_text(11, entry.last_error);
        stmt.bind_text(12, outbox_status_name(entry.status));
        stmt.run();
        stmt.reset();
    }
    tx.commit();
}

void SqliteOutboxStore::remove(const std::vector<SyncMessage>& confirmed) {
    if (confirmed.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    SqliteTransaction tx(db_);
    // Messages sent straight from the buffer never had a row, so the cursor is
    // fed from the message itself.
    SqliteStatement cursor(db_,
        "INSERT INTO sync_cursor (session_id, sender_device_id, last_synced_sequence) "
        "VALUES (?1, ?2, ?3) "
        "ON CONFLICT(session_id, sender_device_id) DO UPDATE SET "
        "last_synced_sequence = MAX(last_synced_sequence, excluded.last_synced_sequence);");
    SqliteStatement stmt(db_, "DELETE FROM outbox WHERE event_id = ?1;");
    for (const auto& msg : confirmed) {
        if (!msg.session_id.empty() && !msg.sender_device_id.empty() && msg.sequence_number > 0) {
            cursor.bind_text(1, msg.session_id);
            cursor.bind_text(2, msg.sender_device_id);
            cursor.bind_int64(3, msg.sequence_number);
            cursor.run();
            cursor.reset();
        }
        stmt.bind_text(1, msg.event_id);
        stmt.run();
        stmt.reset();
    }
    tx.commit();
}

std::optional<OutboxEntry> SqliteOutboxStore::get(const std::string& event_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sql = select_sql("WHERE event_id = ?1;");
    SqliteStatement stmt(db_, sql.c_str());
    stmt.bind_text(1, event_id);
    if (!stmt.step()) return std::nullopt;
    return read_row(stmt);
}

std::vector<OutboxEntry> SqliteOutboxStore::due(int64_t now_ms, size_t limit) {
    std::vector<OutboxEntry> result;
    if (limit == 0) return result;

    std::lock_guard<std::mutex> lock(mutex_);
    auto sql = select_sql(
        "WHERE status = 'pending' AND next_retry_at <= ?1 "
        "ORDER BY next_retry_at ASC, created_at ASC, sequence_number ASC LIMIT ?2;");
    SqliteStatement stmt(db_, sql.c_str());
    stmt.bind_int64(1, now_ms);
    stmt.bind_int64(2, static_cast<int64_t>(limit));
    while (stmt.step()) {
        result.push_back(read_row(stmt));
    }
    return result;
}

std::vector<OutboxEntry> SqliteOutboxStore::list(OutboxStatus status) {
    std::vector<OutboxEntry> result;

    std::lock_guard<std::mutex> lock(mutex_);
    auto sql = select_sql("WHERE status = ?1 ORDER BY created_at ASC, sequence_number ASC;");
    SqliteStatement stmt(db_, sql.c_str());
    stmt.bind_text(1, outbox_status_name(status));
    while (stmt.step()) {
        result.push_back(read_row(stmt));
    }
    return result;
}

size_t SqliteOutboxStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement stmt(db_, "SELECT COUNT(*) FROM outbox;");
    if (!stmt.step()) return 0;
    return static_cast<size_t>(stmt.column_int64(0));
}

int64_t SqliteOutboxStore::max_sequence(const std::string& session_id, const std::string& sender_device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement stmt(db_,
        "SELECT MAX("
        "  COALESCE((SELECT MAX(sequence_number) FROM outbox WHERE session_id = ?1 AND sender_device_id = ?2), 0),"
        "  COALESCE((SELECT last_synced_sequence FROM sync_cursor WHERE session_id = ?1 AND sender_device_id = ?2), 0));");
    stmt.bind_text(1, session_id);
    stmt.bind_text(2, sender_device_id);
    if (!stmt.step()) return 0;
    return stmt.column_int64(0);
}

bool SqliteOutboxStore::retry_failed(const std::string& event_id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement stmt(db_,
        "UPDATE outbox SET status = 'pending', sync_attempts = 0, next_retry_at = ?2 "
        "WHERE event_id = ?1 AND status = 'failed';");
    stmt.bind_text(1, event_id);
    stmt.bind_int64(2, now_ms);
    stmt.run();
    return sqlite3_changes(db_.handle()) > 0;
}

}
