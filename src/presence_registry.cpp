#include "presence_registry.hpp"

#include <functional>
#include <mutex>

namespace tether {

PresenceRegistry::PresenceRegistry(size_t shard_count) {
    if (shard_count == 0) shard_count = 1;
    shards_.reserve(shard_count);
    device_shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<SessionShard>());
        device_shards_.push_back(std::make_unique<DeviceShard>());
    }
}

PresenceRegistry::SessionShard& PresenceRegistry::session_shard(const std::string& session_id) const {
    return *shards_[std::hash<std::string>{}(session_id) % shards_.size()];
}

PresenceRegistry::DeviceShard& PresenceRegistry::device_shard(const std::string& device_id) const {
    return *device_shards_[std::hash<std::string>{}(device_id) % device_shards_.size()];
}

PresenceRegistry::JoinResult PresenceRegistry::join(const std::string& session_id, const Participant& participant) {
    JoinResult result;
    auto& shard = session_shard(session_id);
    std::unique_lock lock(shard.mutex);
    auto& members = shard.sessions[session_id];
    if (!members.empty() && members.begin()->second.user_id != participant.user_id) {
        result.rejected = true;
        return result;
    }
    auto [it, inserted] = members.emplace(participant.device_id, participant);
    result.added = inserted;
    result.participant = it->second;
    result.participants.reserve(members.size());
    for (const auto& [id, p] : members) {
        result.participants.push_back(p);
    }

    // Lock order is always session shard, then device shard.
    if (result.added) {
        auto& index = device_shard(participant.device_id);
        std::unique_lock index_lock(index.mutex);
        index.sessions[participant.device_id].insert(session_id);
    }
    return result;
}

std::optional<Participant> PresenceRegistry::leave(const std::string& session_id, const std::string& device_id) {
    auto& shard = session_shard(session_id);
    std::unique_lock lock(shard.mutex);
    auto sit = shard.sessions.find(session_id);
    if (sit == shard.sessions.end()) return std::nullopt;

    auto mit = sit->second.find(device_id);
    if (mit == sit->second.end()) return std::nullopt;

    std::optional<Participant> removed = std::move(mit->second);
    sit->second.erase(mit);
    if (sit->second.empty()) {
        shard.sessions.erase(sit);
    }

    auto& index = device_shard(device_id);
    std::unique_lock index_lock(index.mutex);
    auto dit = index.sessions.find(device_id);
    if (dit != index.sessions.end()) {
        dit->second.erase(session_id);
        if (dit->second.empty()) index.sessions.erase(dit);
    }
    return removed;
}

std::vector<std::pair<std::string, Participant>> PresenceRegistry::leave_all(const std::string& device_id) {
    std::vector<std::pair<std::string, Participant>> removed;
    for (const auto& session_id : sessions_of(device_id)) {
        // A concurrent leave may win the race; only the caller that removes the record reports it.
        if (auto p = leave(session_id, device_id)) {
            removed.emplace_back(session_id, std::move(*p));
        }
    }
    return removed;
}

std::vector<Participant> PresenceRegistry::participants(const std::string& session_id) const {
    std::vector<Participant> result;
    auto& shard = session_shard(session_id);
    std::shared_lock lock(shard.mutex);
    auto it = shard.sessions.find(session_id);
    if (it == shard.sessions.end()) return result;
    result.reserve(it->second.size());
    for (const auto& [id, p] : it->second) {
        result.push_back(p);
    }
    return result;
}

std::optional<Participant> PresenceRegistry::find(const std::string& session_id, const std::string& device_id) const {
    auto& shard = session_shard(session_id);
    std::shared_lock lock(shard.mutex);
    auto sit = shard.sessions.find(session_id);
    if (sit == shard.sessions.end()) return std::nullopt;
    auto mit = sit->second.find(device_id);
    if (mit == sit->second.end()) return std::nullopt;
    return mit->second;
}

bool PresenceRegistry::is_member(const std::string& session_id, const std::string& device_id) const {
    return find(session_id, device_id).has_value();
}

std::vector<std::string> PresenceRegistry::sessions_of(const std::string& device_id) const {
    auto& shard = device_shard(device_id);
    std::shared_lock lock(shard.mutex);
    auto it = shard.sessions.find(device_id);
    if (it == shard.sessions.end()) return {};
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

size_t PresenceRegistry::session_count() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        total += shard->sessions.size();
    }
    return total;
}

}
