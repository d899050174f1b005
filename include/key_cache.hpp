#pragma once

#include <string>
#include <map>
#include <optional>
#include <shared_mutex>
#include <utility>

#include "crypto.hpp"

namespace tether {

// Process-local store of unwrapped session keys, scoped by (userId, sessionId).
// Entries live until invalidated, cleared for a user (logout) or the process exits.
// Nothing here is ever written to disk.
class KeyCache {
public:
    KeyCache() = default;
    KeyCache(const KeyCache&) = delete;
    KeyCache& operator=(const KeyCache&) = delete;

    void put(const std::string& user_id, const std::string& session_id, SecureBytes key);
    std::optional<SecureBytes> get(const std::string& user_id, const std::string& session_id) const;
    bool contains(const std::string& user_id, const std::string& session_id) const;

    void invalidate(const std::string& user_id, const std::string& session_id);
    void clear_user(const std::string& user_id);
    void clear();

    size_t size() const;

private:
    using Key = std::pair<std::string, std::string>;
    std::map<Key, SecureBytes> entries_;
    mutable std::shared_mutex mutex_;
};

}
