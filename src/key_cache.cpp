#include "key_cache.hpp"

#include <mutex>

namespace tether {

void KeyCache::put(const std::string& user_id, const std::string& session_id, SecureBytes key) {
    std::unique_lock lock(mutex_);
    entries_[{user_id, session_id}] = std::move(key);
}

std::optional<SecureBytes> KeyCache::get(const std::string& user_id, const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find({user_id, session_id});
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

bool KeyCache::contains(const std::string& user_id, const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    return entries_.count({user_id, session_id}) > 0;
}

void KeyCache::invalidate(const std::string& user_id, const std::string& session_id) {
    std::unique_lock lock(mutex_);
    entries_.erase({user_id, session_id});
}

// Keys are ordered by user first, so one user's sessions form a contiguous range.
void KeyCache::clear_user(const std::string& user_id) {
    std::unique_lock lock(mutex_);
    auto it = entries_.lower_bound({user_id, std::string()});
    while (it != entries_.end() && it->first.first == user_id) {
        it = entries_.erase(it);
    }
}

void KeyCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t KeyCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}
